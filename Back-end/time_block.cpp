#include "time_block.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace {
const std::string DAY_LETTERS = "UMTWRFS";
}

DayMask day_bit(char letter) {
    auto pos = DAY_LETTERS.find(static_cast<char>(std::toupper(static_cast<unsigned char>(letter))));
    if (pos == std::string::npos) return 0;
    return static_cast<DayMask>(1u << pos);
}

DayMask parse_days(const std::string& days) {
    DayMask mask = 0;
    for (char c : days) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        DayMask bit = day_bit(c);
        if (bit == 0) {
            throw std::invalid_argument("Unknown day letter '" + std::string(1, c) + "' in \"" + days + "\"");
        }
        mask |= bit;
    }
    return mask;
}

std::string format_days(DayMask mask) {
    // Week order M..F then weekend, matching how the registrar prints them.
    static const char order[] = {'M', 'T', 'W', 'R', 'F', 'S', 'U'};
    std::string out;
    for (char c : order) {
        if (mask & day_bit(c)) out += c;
    }
    return out;
}

int parse_hhmm(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || text.size() != colon + 3) {
        throw std::invalid_argument("Expected HH:MM, got \"" + text + "\"");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i != colon && !std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Expected HH:MM, got \"" + text + "\"");
        }
    }

    int hours = std::stoi(text.substr(0, colon));
    int minutes = std::stoi(text.substr(colon + 1));
    if (minutes > 59 || hours > 24 || (hours == 24 && minutes != 0)) {
        throw std::invalid_argument("Time out of range: \"" + text + "\"");
    }
    return hours * 60 + minutes;
}

std::string format_hhmm(int minutes) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return buf;
}

TimeBlock::TimeBlock(DayMask days, int start_minutes, int end_minutes)
    : days_(days), start_(start_minutes), end_(end_minutes) {
    if ((days_ & ALL_DAYS) == 0 || (days_ & ~ALL_DAYS) != 0) {
        throw std::invalid_argument("Time block needs at least one weekday");
    }
    if (start_ < 0 || end_ > MINUTES_PER_DAY) {
        throw std::invalid_argument("Time block outside of the day: " + format_hhmm(start_) + "-" + format_hhmm(end_));
    }
    if (start_ >= end_) {
        throw std::invalid_argument("Time block must start before it ends: " + format_hhmm(start_) + "-" + format_hhmm(end_));
    }
}
