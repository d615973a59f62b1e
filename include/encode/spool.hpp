#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "io/image_types.hpp"

namespace thermlabel {

// Finished job for the print subsystem. `options` is passed through
// verbatim (e.g. "Darkness=10"); it is never interpreted here.
struct SpoolPayload {
    PixelBuffer raster;                // Mono1, label pixel size
    std::vector<uint8_t> packed_rows;  // MSB first, set bit = black dot
    int stride = 0;                    // bytes per packed row
    int dpi = 0;                       // 0 = unknown
    std::string options;
};

SpoolPayload to_spool_format(const PixelBuffer& mono, const std::string& options = "", int dpi = 0);

// Whitespace-separated option tokens, in order.
std::vector<std::string> split_print_options(const std::string& options);

// argv of the `lp` submission for a payload written to `file`:
//   lp -d <printer> [-o PageSize=w<pt>h<pt>] -o scaling=100 [-o ppi=<dpi>] [-o <opt> ...] <file>
std::vector<std::string> lp_command(const std::string& printer, const std::string& file, const SpoolPayload& payload);

// Print collaborator. Implementations own the transport.
class PrintSpooler {
public:
    virtual ~PrintSpooler() = default;
    virtual void submit(const SpoolPayload& payload) = 0;
};

// Writes the payload as PNG to `spool_path` and reports the lp command
// line that would submit it, without running it.
class LpDryRunSpooler : public PrintSpooler {
public:
    LpDryRunSpooler(std::string printer, std::string spool_path, std::ostream& log);
    void submit(const SpoolPayload& payload) override;

    const std::vector<std::string>& last_command() const { return last_command_; }

private:
    std::string printer_;
    std::string spool_path_;
    std::ostream& log_;
    std::vector<std::string> last_command_;
};

} // namespace thermlabel
