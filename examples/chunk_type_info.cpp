/**
 * @file chunk_type_info.cpp
 * @brief Print the properties of PNG chunk type codes
 *
 * Takes one or more 4-letter chunk types on the command line and prints
 * what their case bits say about each of them.
 */

#include <pngchunk/chunk_type.hh>
#include <pngchunk/chunk_ids.hh>
#include <pngchunk/conformance.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <chunk type>...\n";
        std::cout << "\n";
        std::cout << "Example: " << argv[0] << " IHDR tEXt RuSt\n";
        return 1;
    }

    pngchunk::check_options options;
    options.on_warning = [](std::uint64_t, std::string_view category, std::string_view message) {
        std::cout << "  [" << category << "] " << message << "\n";
    };

    int errors = 0;
    for (int i = 1; i < argc; i++) {
        try {
            auto type = pngchunk::chunk_type::from_ascii_str(argv[i]);

            std::cout << type << " (" << std::hex << type << std::dec << ")"
                      << (pngchunk::is_known(type) ? " registered" : " unregistered") << "\n";
            std::cout << "  " << pngchunk::describe(type) << "\n";

            pngchunk::check(type, options);
        } catch (const pngchunk::chunk_error& e) {
            std::cerr << "Error: '" << argv[i] << "': " << e.what() << "\n";
            errors++;
        }
    }

    return errors == 0 ? 0 : 1;
}
