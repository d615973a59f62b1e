// Runs one label job per dithering algorithm and reports tone fidelity.
#include "dither/dither_config.hpp"
#include "dither/dither_engine.hpp"
#include "encode/png_encoder.hpp"
#include "io/image_loader.hpp"
#include "io/image_saver.hpp"
#include "label/label_catalog.hpp"
#include "pipeline/job.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Cli {
    std::string in;
    std::string label = "4x6";
    std::string out_dir;
    std::string out_csv;
    double brightness = 1.0;
    double contrast = 1.0;
};

Cli parse_cli(int argc, char** argv) {
    Cli c;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a == "--in" && i + 1 < argc) {
            c.in = argv[++i];
        } else if (a == "--label" && i + 1 < argc) {
            c.label = argv[++i];
        } else if (a == "--out_dir" && i + 1 < argc) {
            c.out_dir = argv[++i];
        } else if (a == "--csv" && i + 1 < argc) {
            c.out_csv = argv[++i];
        } else if ((a == "--brightness" || a == "--contrast") && i + 1 < argc) {
            const std::string v = argv[++i];
            try {
                (a == "--brightness" ? c.brightness : c.contrast) = std::stod(v);
            } catch (const std::exception&) {
                throw std::runtime_error(a + " must be a number");
            }
        } else {
            throw std::runtime_error("Unknown argument: " + a);
        }
    }
    if (c.in.empty() || c.out_dir.empty() || c.out_csv.empty()) {
        throw std::runtime_error("Usage: thermlabel_compare --in <image> --label <code> --out_dir <dir> --csv <report.csv>");
    }
    return c;
}

double mean_gray(const thermlabel::PixelBuffer& gray) {
    uint64_t sum = 0;
    for (uint8_t v : gray.pixels) sum += v;
    return static_cast<double>(sum) / static_cast<double>(gray.pixels.size());
}

} // namespace

int main(int argc, char** argv) {
    try {
        Cli cli = parse_cli(argc, argv);
        fs::create_directories(cli.out_dir);

        const thermlabel::PixelBuffer source = thermlabel::load_grayscale(cli.in);
        const std::string stem = fs::path(cli.in).stem().string();

        thermlabel::JobSettings job(thermlabel::find_label(cli.label));
        job.enhancement.brightness = cli.brightness;
        job.enhancement.contrast = cli.contrast;

        std::ofstream ofs(cli.out_csv, std::ios::trunc);
        if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + cli.out_csv);
        ofs << "algorithm,width,height,mean_gray,white_fraction\n";

        for (thermlabel::DitherAlgorithm a : thermlabel::all_dither_algorithms()) {
            job.dither.algorithm = a;
            const std::string name = thermlabel::dither_algorithm_name(a);

            thermlabel::JobResult r = thermlabel::run_job(source, job);
            const std::string png_path = (fs::path(cli.out_dir) / (stem + "_" + name + ".png")).string();
            thermlabel::write_all(png_path, thermlabel::encode_png(r.mono, job.label.dpi()));

            ofs << name << ","
                << r.mono.width << ","
                << r.mono.height << ","
                << mean_gray(r.fitted) / 255.0 << ","
                << thermlabel::white_fraction(r.mono) << "\n";
            std::cout << "Wrote: " << png_path << "\n";
        }

        std::cout << "Comparison completed -> " << cli.out_csv << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
