#include "Steganographer.hh"

#include <algorithm>

namespace Bacon
{
    bool Steganographer::is_alphabetic(char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    std::size_t Steganographer::count_alphabetic(const std::string& text)
    {
        return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), &Steganographer::is_alphabetic));
    }

    std::optional<BaconError> Steganographer::validate_secret(const std::string& /*secret*/,
                                                              const std::string& /*public_text*/,
                                                              std::size_t /*group_size*/) const
    {
        return std::nullopt;
    }

    std::string Steganographer::walk_public(const std::string& public_text, const SymbolStream& symbols,
                                            const std::function<void(std::string&, char, Symbol)>& emit)
    {
        std::string disguised;
        disguised.reserve(public_text.size());

        std::size_t i = 0;
        for (char pc : public_text) {
            if (is_alphabetic(pc) && i < symbols.size()) {
                emit(disguised, pc, symbols[i]);
                ++i;
            } else {
                disguised.push_back(pc);
            }
        }
        return disguised;
    }

    SymbolStream Steganographer::symbols_of(const std::vector<ParsedElement>& elements)
    {
        SymbolStream symbols;
        for (const ParsedElement& element : elements) {
            if (element.type == ElementType::Other)
                continue;
            const Symbol symbol = element.type == ElementType::A ? Symbol::A : Symbol::B;
            for (char c : element.text)
                if (is_alphabetic(c))
                    symbols.push_back(symbol);
        }
        return symbols;
    }
} // Bacon
