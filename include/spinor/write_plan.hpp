#ifndef SPINOR_WRITE_PLAN_HPP
#define SPINOR_WRITE_PLAN_HPP

#include <cstddef>
#include <stdint.h>
#include <vector>

namespace spinor {

// One program command: data[offset, offset + length) goes to address.
struct PageChunk {
    uint32_t address = 0;
    std::size_t offset = 0;
    std::size_t length = 0;
};

// Splits a write so that no chunk crosses a page boundary. page_size must be a power of two.
std::vector<PageChunk> plan_page_writes(uint32_t address, std::size_t length, uint32_t page_size);

} // namespace spinor

#endif // SPINOR_WRITE_PLAN_HPP
