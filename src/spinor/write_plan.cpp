#include "spinor/write_plan.hpp"

#include <algorithm>
#include <stdexcept>

namespace spinor {

std::vector<PageChunk> plan_page_writes(uint32_t address, std::size_t length, uint32_t page_size) {
    if (page_size == 0 || (page_size & (page_size - 1)) != 0) {
        throw std::logic_error("page size must be a power of two");
    }
    std::vector<PageChunk> chunks;
    chunks.reserve(length / page_size + 2);
    std::size_t offset = 0;
    while (offset < length) {
        const uint32_t room = page_size - (address & (page_size - 1));
        const std::size_t count = std::min<std::size_t>(room, length - offset);
        chunks.push_back(PageChunk{address, offset, count});
        address += static_cast<uint32_t>(count);
        offset += count;
    }
    return chunks;
}

} // namespace spinor
