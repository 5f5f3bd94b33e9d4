#pragma once

#include <cstdint>
#include <string>

// ==================== WEEKDAYS ====================
// Registrar day letters: U M T W R F S (Sunday..Saturday).
using DayMask = std::uint8_t;

constexpr DayMask ALL_DAYS = 0x7F;
constexpr int MINUTES_PER_DAY = 24 * 60;

DayMask day_bit(char letter);              // 0 for an unknown letter
DayMask parse_days(const std::string& days);  // throws std::invalid_argument
std::string format_days(DayMask mask);

int parse_hhmm(const std::string& text);   // throws std::invalid_argument
std::string format_hhmm(int minutes);

// ==================== TIME BLOCK ====================
class TimeBlock {
public:
    // Throws std::invalid_argument unless days != 0 and 0 <= start < end <= 24:00.
    TimeBlock(DayMask days, int start_minutes, int end_minutes);

    DayMask days() const { return days_; }
    int start() const { return start_; }
    int end() const { return end_; }

    bool operator==(const TimeBlock& other) const {
        return days_ == other.days_ && start_ == other.start_ && end_ == other.end_;
    }

private:
    DayMask days_;
    int start_;
    int end_;
};

// ==================== CONFLICT CHECKS ====================
// Half-open intervals: a block ending at 10:00 does not clash with one starting at 10:00.
inline bool conflicts(const TimeBlock& a, const TimeBlock& b) {
    if ((a.days() & b.days()) == 0) return false;
    return a.start() < b.end() && b.start() < a.end();
}
