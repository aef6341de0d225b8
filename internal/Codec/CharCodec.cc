#include "CharCodec.hh"

namespace Bacon
{
    const GroupTable kBaconTableV1 = {
        0b00000, 0b00001, 0b00010, 0b00011, 0b00100, 0b00101, 0b00110, 0b00111,   // A-H
        0b01000, 0b01000, 0b01001, 0b01010, 0b01011, 0b01100, 0b01101, 0b01110,   // I-P
        0b01111, 0b10000, 0b10001, 0b10010, 0b10011, 0b10011, 0b10100, 0b10101,   // Q-X
        0b10110, 0b10111                                                          // Y-Z
    };

    const GroupTable kBaconTableV2 = {
        0b00000, 0b00001, 0b00010, 0b00011, 0b00100, 0b00101, 0b00110, 0b00111,
        0b01000, 0b01001, 0b01010, 0b01011, 0b01100, 0b01101, 0b01110, 0b01111,
        0b10000, 0b10001, 0b10010, 0b10011, 0b10100, 0b10101, 0b10110, 0b10111,
        0b11000, 0b11001
    };

    const GroupTable& group_table(CodecVariant variant)
    {
        switch (variant) {
            case CodecVariant::V1:
                return kBaconTableV1;
            case CodecVariant::V2:
                return kBaconTableV2;
        }
        return kBaconTableV1;
    }

    const char* variant_name(CodecVariant variant)
    {
        switch (variant) {
            case CodecVariant::V1:
                return "V1";
            case CodecVariant::V2:
                return "V2";
        }
        return "Unknown";
    }
} // Bacon
