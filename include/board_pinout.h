#ifndef H_BOARD_PINOUT_H
#define H_BOARD_PINOUT_H

// HX711 bridge ADC: DOUT is the chip's data/ready output, PD_SCK its clock and power-down input.
#define HX711_DATA_PIN  (5)
#define HX711_CLOCK_PIN (6)

#define HX711_DEFAULT_GAIN (128)

// Operator console. Also carries ESP_LOGx output.
#define CONSOLE_SERIAL      Serial
#define CONSOLE_BAUD_RATE   (115200)

#endif // H_BOARD_PINOUT_H
