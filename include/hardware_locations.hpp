#ifndef NORWORKS_HARDWARE_LOCATIONS_HPP
#define NORWORKS_HARDWARE_LOCATIONS_HPP

// ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
// Pin Definitions
//
// The flash sits on the Raspberry Pi SPI0 header. SCLK/MOSI/MISO/CE are owned by the
// SPI peripheral (ALT0); only the auxiliary control lines are driven as plain GPIOs.
// All numbers are BCM GPIO numbers.
// ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

// SPI0 lines (reference only, muxed by bcm2835_spi_begin()).
#define GPIO_SPI_CE0  8   // Chip select 0, active low (default flash select)
#define GPIO_SPI_CE1  7   // Chip select 1, active low
#define GPIO_SPI_MISO 9   // Flash SO / IO1
#define GPIO_SPI_MOSI 10  // Flash SI / IO0
#define GPIO_SPI_SCLK 11  // Serial clock

// Auxiliary control lines.
#define GPIO_FLASH_WP   25 // Write Protect (WP#/IO2): hold high to allow status register writes. Active low.
#define GPIO_FLASH_HOLD 24 // Hold (HOLD#/RESET#/IO3): hold high for normal operation. Active low.

// Default SPI chip select index (0 -> CE0, 1 -> CE1).
#define NORWORKS_DEFAULT_CHIP_SELECT 0

#endif // NORWORKS_HARDWARE_LOCATIONS_HPP
