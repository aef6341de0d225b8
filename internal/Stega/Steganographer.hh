#ifndef BACONSTEGO_STEGANOGRAPHER_HH
#define BACONSTEGO_STEGANOGRAPHER_HH

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <defines.hh>
#include <BaconCodec.hh>
#include <BaconError.hh>

namespace Bacon
{
    /**Codec-independent view of one encoded element*/
    enum class Symbol : uint8_t
    {
        A, B
    };

    using SymbolStream = std::vector<Symbol>;

    /**Classification of a token found while scanning disguised text*/
    enum class ElementType : uint8_t
    {
        A, B, Other
    };

    struct ParsedElement
    {
        std::string text;
        ElementType type = ElementType::Other;

        bool operator==(const ParsedElement& other) const
        { return this->text == other.text && this->type == other.type; }
    };

    /**
     * Interface for text carriers.
     * disguise()/reveal() accept any codec over chars, whatever its alphabet type;
     * carriers only see the A/B symbol stream.
     */
    class Steganographer
    {
    protected:
        /**
         * Check a secret before disguising it
         * @param secret Secret text
         * @param public_text Carrier text
         * @param group_size Codec's encoded_group_size()
         * @return error or std::nullopt if the secret can be hidden
         */
        virtual std::optional<BaconError> validate_secret(const std::string& secret,
                                                          const std::string& public_text,
                                                          std::size_t group_size) const;

        /**
         * Hide a symbol stream in public_text
         * @return disguised text
         */
        virtual std::string disguise_symbols(const SymbolStream& symbols, const std::string& public_text) const = 0;

        /**
         * Recover the symbol stream hidden in input
         */
        virtual SymbolStream reveal_symbols(const std::string& input) const = 0;

        /**
         * Symbols of every alphabetic char in the elements, in order. Other elements are skipped.
         */
        static SymbolStream symbols_of(const std::vector<ParsedElement>& elements);

    public:
        /**Correct delete for children*/
        virtual ~Steganographer() = default;

        /**ASCII letter check used for both secret and public text*/
        static bool is_alphabetic(char c);

        static std::size_t count_alphabetic(const std::string& text);

        /**
         * Walk public_text, handing each alphabetic char to emit() together with the next symbol.
         * Other chars, and every char once symbols are exhausted, are copied unchanged.
         */
        static std::string walk_public(const std::string& public_text, const SymbolStream& symbols,
                                       const std::function<void(std::string&, char, Symbol)>& emit);

        /**
         * Project an encoded sequence on symbols.
         * Stops at the first element that is neither codec.a() nor codec.b().
         */
        template <typename AB>
        static SymbolStream to_symbols(const std::vector<AB>& encoded, const BaconCodec<AB, char>& codec)
        {
            SymbolStream symbols;
            symbols.reserve(encoded.size());
            for (std::size_t i = 0; i < encoded.size(); ++i) {
                const AB elem = encoded[i];
                if (codec.is_a(elem))
                    symbols.push_back(Symbol::A);
                else if (codec.is_b(elem))
                    symbols.push_back(Symbol::B);
                else
                    break;
            }
            return symbols;
        }

        /**
         * Hide secret inside public_text
         * @param secret Text to hide
         * @param public_text Carrier text
         * @param codec Codec used to encode the secret
         * @return disguised text or the validation error
         */
        template <typename AB>
        Result<std::string> disguise(const std::string& secret, const std::string& public_text,
                                     const BaconCodec<AB, char>& codec) const
        {
            std::optional<BaconError> error = this->validate_secret(secret, public_text, codec.encoded_group_size());
            if (error)
                return *error;

            const std::vector<AB> encoded = codec.encode(std::vector<char>(secret.begin(), secret.end()));
            return this->disguise_symbols(to_symbols(encoded, codec), public_text);
        }

        /**
         * Get the secret back from disguised text.
         * Best effort: text without a secret decodes to garbage, not to an error.
         * @param input Disguised text
         * @param codec Codec; only a(), b() and decode() are used
         * @return decoded secret (upper case letters, ' ' for unknown groups)
         */
        template <typename AB>
        Result<std::string> reveal(const std::string& input, const BaconCodec<AB, char>& codec) const
        {
            const SymbolStream symbols = this->reveal_symbols(input);
            std::vector<AB> encoded;
            encoded.reserve(symbols.size());
            for (Symbol symbol : symbols)
                encoded.push_back(symbol == Symbol::A ? codec.a() : codec.b());

            const std::vector<char> decoded = codec.decode(encoded);
            return std::string(decoded.begin(), decoded.end());
        }

        /**Carrier name for logs and UI*/
        [[nodiscard]] virtual std::string name() const = 0;
    };
} // Bacon

#endif //BACONSTEGO_STEGANOGRAPHER_HH
