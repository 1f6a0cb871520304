#include "cli/cli_parser.hpp"
#include "io/ppm_loader.hpp"
#include "io/ppm_saver.hpp"
#include "steg/steg_engine.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

static const char* kUsage =
    "Usage: steg_hide --in <cover.ppm> --out <stego.ppm> (--msg <text> | --msg_file <path>)\n";

int main(int argc, char** argv) {
    try {
        ppmsteg::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty() || cli.has("msg") == cli.has("msg_file")) {
            std::cout << kUsage;
            return 1;
        }

        std::vector<uint8_t> msg;
        if (cli.has("msg_file")) {
            msg = ppmsteg::read_file_bytes(cli.get("msg_file"));
        } else {
            const std::string text = cli.get("msg");
            msg.assign(text.begin(), text.end());
        }

        auto cover = ppmsteg::load_ppm(in);
        auto stego = ppmsteg::hide(cover, msg);
        ppmsteg::save_ppm(out, stego);

        std::cout << "Hidden " << msg.size() << " of " << ppmsteg::max_message_bytes(cover)
                  << " bytes in " << cover.width << "x" << cover.height << " image\n";
        std::cout << "Wrote: " << out << " (" << stego.size() << " bytes)\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
