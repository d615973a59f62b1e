#include "cli/cli_parser.hpp"
#include "dither/dither_config.hpp"
#include "encode/png_encoder.hpp"
#include "encode/spool.hpp"
#include "io/image_loader.hpp"
#include "io/image_saver.hpp"
#include "label/label_catalog.hpp"
#include "pipeline/job.hpp"

#include <iostream>
#include <string>

static const char* kUsage =
    "Usage: thermlabel --in <image> --out <label.png|label.pgm> [--label 4x6] [--brightness 1.2] [--contrast 1.0]\n"
    "                  [--dither floyd] [--history 16] [--ratio 0.1] [--options \"<lp options>\"]\n"
    "                  [--printer <name>]\n"
    "       thermlabel --list-labels\n";

static bool ends_with_pgm(const std::string& path) {
    return path.size() >= 4 && path.compare(path.size() - 4, 4, ".pgm") == 0;
}

static void print_labels() {
    for (const auto& g : thermlabel::label_catalog()) {
        std::cout << g.code() << " - " << g.name() << " [" << g.brand() << "] "
                  << g.width_px() << " x " << g.height_px() << " px @ " << g.dpi() << " dpi\n";
    }
}

int main(int argc, char** argv) {
    try {
        thermlabel::CliParser cli;
        cli.parse(argc, argv);
        if (cli.has("list-labels")) {
            print_labels();
            return 0;
        }

        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cout << kUsage;
            return 1;
        }

        const std::string printer = cli.get("printer");
        thermlabel::JobSettings job(thermlabel::find_label(cli.get("label", "4x6")));
        job.enhancement.brightness = cli.get_double("brightness", job.enhancement.brightness);
        job.enhancement.contrast = cli.get_double("contrast", job.enhancement.contrast);
        job.dither.algorithm = thermlabel::parse_dither_algorithm(cli.get("dither", "floyd"));
        job.dither.history = cli.get_int("history", job.dither.history);
        job.dither.ratio = cli.get_double("ratio", job.dither.ratio);
        // Dymo drivers need their density/quality options unless the user overrides them
        const std::string brand = printer.empty() ? job.label.brand() : thermlabel::brand_for_printer(printer);
        job.print_options = cli.get("options", thermlabel::default_print_options(brand));

        auto source = thermlabel::load_grayscale(in);
        auto mono = thermlabel::prepare_label(source, job);
        if (ends_with_pgm(out)) {
            thermlabel::save_pgm(out, mono);
        } else {
            thermlabel::write_all(out, thermlabel::encode_png(mono, job.label.dpi()));
        }

        std::cout << "input: " << source.width << " x " << source.height << " px\n";
        std::cout << "label: " << job.label.code() << " (" << mono.width << " x " << mono.height
                  << " px, " << thermlabel::dither_algorithm_name(job.dither.algorithm) << ")\n";
        std::cout << "Wrote: " << out << "\n";

        if (!printer.empty()) {
            auto payload = thermlabel::to_spool_format(mono, job.print_options, job.label.dpi());
            // lp gets a PNG even when the preview is a PGM
            const std::string spool_path = ends_with_pgm(out) ? out.substr(0, out.size() - 4) + ".png" : out;
            thermlabel::LpDryRunSpooler spooler(printer, spool_path, std::cout);
            spooler.submit(payload);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
