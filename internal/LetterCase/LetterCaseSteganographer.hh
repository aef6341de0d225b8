#ifndef BACONSTEGO_LETTERCASESTEGANOGRAPHER_HH
#define BACONSTEGO_LETTERCASESTEGANOGRAPHER_HH

#include <Steganographer.hh>

namespace Bacon
{
    /**
     * Hides symbols in the case of letters: lower case = A, upper case = B.
     */
    class LetterCaseSteganographer : public Steganographer
    {
    protected:
        /**
         * Secret may hold only letters and spaces, and public text needs
         * group_size letters per secret letter.
         */
        std::optional<BaconError> validate_secret(const std::string& secret, const std::string& public_text,
                                                  std::size_t group_size) const override;

        std::string disguise_symbols(const SymbolStream& symbols, const std::string& public_text) const override;

        SymbolStream reveal_symbols(const std::string& input) const override;

    public:
        LetterCaseSteganographer() = default;
        ~LetterCaseSteganographer() override = default;

        [[nodiscard]] std::string name() const override { return "letter-case"; }
    };
} // Bacon

#endif //BACONSTEGO_LETTERCASESTEGANOGRAPHER_HH
