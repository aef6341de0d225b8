#ifndef BACONSTEGO_CHARCODEC_HH
#define BACONSTEGO_CHARCODEC_HH

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "BaconCodec.hh"

namespace Bacon
{
    /**
     * Letter -> group table. Entry i holds the group of letter 'A' + i,
     * most significant of the 5 bits first, bit set = b().
     */
    using GroupTable = std::array<uint8_t, 26>;

    /**Historical variants of the cipher alphabet*/
    enum class CodecVariant : uint8_t
    {
        V1,     // 24 groups, I/J and U/V share a group
        V2      // 26 distinct groups
    };

    extern const GroupTable kBaconTableV1;
    extern const GroupTable kBaconTableV2;

    const GroupTable& group_table(CodecVariant variant);

    const char* variant_name(CodecVariant variant);

    /**Decoded value for unknown or incomplete groups*/
    constexpr char kUnknownContent = ' ';

    /**
     * Table driven Bacon codec over chars (latin letters, case insensitive).
     * @tparam AB Alphabet type
     */
    template <typename AB>
    class TableCodec : public BaconCodec<AB, char>
    {
    private:
        static constexpr std::size_t kGroupSize = 5;

        AB elem_a_;
        AB elem_b_;
        const GroupTable* table_;
        CodecVariant variant_;

    public:
        TableCodec(AB elem_a, AB elem_b, CodecVariant variant)
            : elem_a_(elem_a), elem_b_(elem_b), table_(&group_table(variant)), variant_(variant) {}

        using BaconCodec<AB, char>::encode;
        using BaconCodec<AB, char>::decode;

        std::vector<AB> encode(const std::string& text) const
        { return this->encode(std::vector<char>(text.begin(), text.end())); }

        std::string decode_to_string(const std::vector<AB>& input) const
        {
            std::vector<char> decoded = this->decode(input);
            return std::string(decoded.begin(), decoded.end());
        }

        std::vector<AB> encode_elem(const char& elem) const override
        {
            int index = -1;
            if (elem >= 'a' && elem <= 'z')
                index = elem - 'a';
            else if (elem >= 'A' && elem <= 'Z')
                index = elem - 'A';
            if (index < 0)
                return {};

            const uint8_t bits = (*this->table_)[static_cast<std::size_t>(index)];
            std::vector<AB> group;
            group.reserve(kGroupSize);
            for (std::size_t i = 0; i < kGroupSize; ++i) {
                const bool is_b = (bits >> (kGroupSize - 1 - i)) & 1U;
                group.push_back(is_b ? this->elem_b_ : this->elem_a_);
            }
            return group;
        }

        char decode_elems(const std::vector<AB>& elems) const override
        {
            if (elems.size() != kGroupSize)
                return kUnknownContent;

            uint8_t bits = 0;
            for (std::size_t i = 0; i < kGroupSize; ++i) {
                const AB elem = elems[i];
                bits = static_cast<uint8_t>(bits << 1);
                if (this->is_a(elem))
                    continue;
                if (!this->is_b(elem))
                    return kUnknownContent;
                bits |= 1U;
            }

            // First match wins: V1 decodes shared groups to I and U.
            for (std::size_t i = 0; i < this->table_->size(); ++i)
                if ((*this->table_)[i] == bits)
                    return static_cast<char>('A' + i);
            return kUnknownContent;
        }

        AB a() const override { return this->elem_a_; }

        AB b() const override { return this->elem_b_; }

        std::size_t encoded_group_size() const override { return kGroupSize; }

        [[nodiscard]] CodecVariant variant() const { return this->variant_; }
    };

    /**First variant of the cipher*/
    template <typename AB>
    class CharCodec : public TableCodec<AB>
    {
    public:
        CharCodec(AB elem_a, AB elem_b) : TableCodec<AB>(elem_a, elem_b, CodecVariant::V1) {}
    };

    /**Second variant of the cipher, one group per letter*/
    template <typename AB>
    class CharCodecV2 : public TableCodec<AB>
    {
    public:
        CharCodecV2(AB elem_a, AB elem_b) : TableCodec<AB>(elem_a, elem_b, CodecVariant::V2) {}
    };

    /**The usual 'A'/'B' codec*/
    inline CharCodec<char> make_default_char_codec() { return CharCodec<char>('A', 'B'); }

    inline CharCodecV2<char> make_default_char_codec_v2() { return CharCodecV2<char>('A', 'B'); }
} // Bacon

#endif //BACONSTEGO_CHARCODEC_HH
