#include "spinor/address.hpp"

namespace spinor {

void append_address(std::vector<uint8_t>& command, uint32_t address) {
    for (std::size_t i = kAddressBytes; i-- > 0;) {
        command.push_back(static_cast<uint8_t>((address >> (8 * i)) & 0xFF));
    }
}

std::vector<uint8_t> addressed_command(uint8_t opcode, uint32_t address, std::size_t dummy_bytes) {
    std::vector<uint8_t> command;
    command.reserve(1 + kAddressBytes + dummy_bytes);
    command.push_back(opcode);
    append_address(command, address);
    command.insert(command.end(), dummy_bytes, 0x00);
    return command;
}

} // namespace spinor
