#ifndef SPINOR_DATA_SINK_HPP
#define SPINOR_DATA_SINK_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <string>

namespace spinor {

// Destination for streamed reads.
class DataSink {
public:
    virtual ~DataSink() {}
    virtual void write(const uint8_t* data, std::size_t n) = 0;
    virtual void flush() {}
};

class FileDataSink : public DataSink {
    std::ofstream out_;
public:
    explicit FileDataSink(const std::string& path) : out_(path, std::ios::binary | std::ios::out) {
        if (!out_) {
            throw std::runtime_error("Cannot open '" + path + "' for writing");
        }
    }
    void write(const uint8_t* data, std::size_t n) override {
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
    }
    void flush() override { out_.flush(); }
};

// Classic hexdump: "00070000: FF FF ...  |....|", offsets start at the flash address.
class HexOstreamDataSink : public DataSink {
    std::ostream& out_;
    std::size_t bytes_per_line_;
    uint32_t offset_;
public:
    explicit HexOstreamDataSink(std::ostream& o, uint32_t base_address = 0, std::size_t bytes_per_line = 16)
        : out_(o), bytes_per_line_(bytes_per_line), offset_(base_address) {}

    void write(const uint8_t* data, std::size_t n) override {
        std::size_t i = 0;
        while (i < n) {
            const std::size_t line_end = std::min(i + bytes_per_line_, n);
            out_ << std::setw(8) << std::setfill('0') << std::hex << std::uppercase << offset_ << ": ";
            for (std::size_t j = i; j < i + bytes_per_line_; ++j) {
                if (j > i) out_ << ' ';
                if (bytes_per_line_ == 16 && j == i + 8) out_ << ' ';
                if (j < line_end) {
                    out_ << std::setw(2) << static_cast<unsigned int>(data[j]);
                } else {
                    out_ << "  ";
                }
            }
            out_ << std::dec << std::nouppercase << "  |";
            for (std::size_t j = i; j < line_end; ++j) {
                const char c = static_cast<char>(data[j]);
                out_ << ((c >= 32 && c <= 126) ? c : '.');
            }
            out_ << "|\n";
            offset_ += static_cast<uint32_t>(line_end - i);
            i = line_end;
        }
    }
    void flush() override { out_.flush(); }
};

} // namespace spinor

#endif // SPINOR_DATA_SINK_HPP
