#include "spinor/write_plan.hpp"

#include <cassert>
#include <stdexcept>

using namespace spinor;

int main() {
    // Fits in one page: one command.
    auto chunks = plan_page_writes(0x1000, 256, 256);
    assert(chunks.size() == 1);
    assert(chunks[0].address == 0x1000 && chunks[0].offset == 0 && chunks[0].length == 256);

    chunks = plan_page_writes(0x10F0, 16, 256);
    assert(chunks.size() == 1);

    // Crossing one boundary splits exactly at it.
    chunks = plan_page_writes(0x10F0, 32, 256);
    assert(chunks.size() == 2);
    assert(chunks[0].address == 0x10F0 && chunks[0].length == 16);
    assert(chunks[1].address == 0x1100 && chunks[1].offset == 16 && chunks[1].length == 16);

    // Unaligned start, several full pages, short tail.
    chunks = plan_page_writes(0x80, 0x300, 256);
    assert(chunks.size() == 4);
    assert(chunks[0].length == 0x80);
    assert(chunks[1].address == 0x100 && chunks[1].length == 0x100);
    assert(chunks[2].address == 0x200 && chunks[2].length == 0x100);
    assert(chunks[3].address == 0x300 && chunks[3].offset == 0x280 && chunks[3].length == 0x80);

    // Chunks never overlap and never straddle a page.
    std::size_t covered = 0;
    for (const auto& chunk : plan_page_writes(0x1FF, 1500, 512)) {
        assert(chunk.offset == covered);
        assert((chunk.address & ~511u) == ((chunk.address + chunk.length - 1) & ~511u));
        covered += chunk.length;
    }
    assert(covered == 1500);

    assert(plan_page_writes(0x40, 0, 256).empty());

    bool threw = false;
    try {
        (void)plan_page_writes(0, 10, 264);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
