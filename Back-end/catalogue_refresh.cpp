#include "catalogue_source.hpp"
#include "json_handler.hpp"
#include "schedule_errors.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

// Converts a saved registrar dump into the catalogue file served by schedule_server.
// Run once per term; the server picks the new file up on its next reload check.
int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <datasvc-dump> [output-file]" << std::endl;
        return 1;
    }
    const std::string input_path = argv[1];
    const std::string output_path = argc == 3 ? argv[2] : "all_sections.json";

    std::ifstream in(input_path);
    if (!in) {
        std::cerr << "Cannot open " << input_path << std::endl;
        return 1;
    }
    std::stringstream raw_js;
    raw_js << in.rdbuf();

    RegistrarConversion conversion;
    try {
        std::cout << "Converting registrar dump " << input_path << " ..." << std::endl;
        conversion = transform_registrar_data(json::parse(js_to_json(raw_js.str())));

        // Validate with the same loader the server uses before replacing anything.
        JsonHandler::parse_catalogue(conversion.catalogue);
    } catch (const json::parse_error& e) {
        std::cerr << "Dump is not valid JSON after conversion: " << e.what() << std::endl;
        return 1;
    } catch (const ScheduleError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    for (const auto& warning : conversion.warnings) {
        std::cerr << "  warning: " << warning << std::endl;
    }

    // Write beside the target and rename so a watching server never reads a partial file.
    const std::string temp_path = output_path + ".tmp";
    {
        std::ofstream out(temp_path);
        if (!out) {
            std::cerr << "Cannot write " << temp_path << std::endl;
            return 1;
        }
        out << conversion.catalogue.dump(1) << std::endl;
        if (!out) {
            std::cerr << "Failed writing " << temp_path << std::endl;
            return 1;
        }
    }
    if (std::rename(temp_path.c_str(), output_path.c_str()) != 0) {
        std::cerr << "Cannot replace " << output_path << std::endl;
        return 1;
    }

    std::cout << "Saved " << conversion.section_count << " sections -> " << output_path << std::endl;
    return 0;
}
