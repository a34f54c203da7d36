#ifndef SPINOR_ADDRESS_HPP
#define SPINOR_ADDRESS_HPP

#include <cstddef>
#include <stdint.h>
#include <vector>

namespace spinor {

// Number of address bytes following an addressed opcode.
constexpr std::size_t kAddressBytes = 3;

// Append the 24-bit address, most significant byte first.
void append_address(std::vector<uint8_t>& command, uint32_t address);

// {opcode, a23..16, a15..8, a7..0, dummy...}
std::vector<uint8_t> addressed_command(uint8_t opcode, uint32_t address, std::size_t dummy_bytes = 0);

} // namespace spinor

#endif // SPINOR_ADDRESS_HPP
