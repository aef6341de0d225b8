#ifndef BACONSTEGO_BACONCODEC_HH
#define BACONSTEGO_BACONCODEC_HH

#include <algorithm>
#include <cstddef>
#include <vector>

namespace Bacon
{
    /**
     * Interface for Bacon codecs.
     * Maps every content unit to a fixed size group of AB values and back.
     * @tparam AB Two-valued alphabet type (char, bool, ...). Needs == and copy.
     * @tparam Content Content unit type
     */
    template <typename AB, typename Content = char>
    class BaconCodec
    {
    public:
        using ab_type = AB;
        using content_type = Content;

        /**Correct delete for children*/
        virtual ~BaconCodec() = default;

        /**
         * Encode one content unit
         * @param elem Content unit
         * @return group of encoded_group_size() elements, or empty if elem is not encodable
         */
        virtual std::vector<AB> encode_elem(const Content& elem) const = 0;

        /**
         * Decode one group
         * @param elems Group of AB values. May be shorter than encoded_group_size()
         * @return content unit, or the codec's sentinel for unknown groups
         */
        virtual Content decode_elems(const std::vector<AB>& elems) const = 0;

        virtual AB a() const = 0;

        virtual AB b() const = 0;

        virtual std::size_t encoded_group_size() const = 0;

        /**
         * Encode a content sequence. Unknown units contribute nothing.
         */
        std::vector<AB> encode(const std::vector<Content>& input) const
        {
            std::vector<AB> encoded;
            encoded.reserve(input.size() * this->encoded_group_size());
            for (const Content& elem : input) {
                std::vector<AB> group = this->encode_elem(elem);
                encoded.insert(encoded.end(), group.begin(), group.end());
            }
            return encoded;
        }

        /**
         * Decode an AB sequence group by group.
         * A trailing partial group is passed to decode_elems() as is.
         */
        std::vector<Content> decode(const std::vector<AB>& input) const
        {
            const std::size_t group = this->encoded_group_size();
            std::vector<Content> decoded;
            if (group == 0)
                return decoded;

            decoded.reserve((input.size() + group - 1) / group);
            for (std::size_t i = 0; i < input.size(); i += group) {
                const std::size_t end = std::min(i + group, input.size());
                std::vector<AB> chunk(input.begin() + i, input.begin() + end);
                decoded.push_back(this->decode_elems(chunk));
            }
            return decoded;
        }

        bool is_a(const AB& elem) const { return elem == this->a(); }

        bool is_b(const AB& elem) const { return elem == this->b(); }
    };
} // Bacon

#endif //BACONSTEGO_BACONCODEC_HH
