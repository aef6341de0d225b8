#ifndef BACONSTEGO_MARKDOWNSTEGANOGRAPHER_HH
#define BACONSTEGO_MARKDOWNSTEGANOGRAPHER_HH

#include <utility>
#include <vector>

#include <Steganographer.hh>
#include "Marker.hh"

namespace Bacon
{
    /**
     * Hides symbols by wrapping letters in text markers (markdown emphasis and the like).
     * If one marker is empty, every unmarked letter belongs to its symbol.
     */
    class MarkdownSteganographer : public Steganographer
    {
    private:
        /**Marked token and the [begin, end) range it covers, delimiters included*/
        struct Span
        {
            ParsedElement element;
            std::size_t begin;
            std::size_t end;
        };

        Marker a_marker_;
        Marker b_marker_;

        MarkdownSteganographer(Marker a_marker, Marker b_marker)
            : a_marker_(std::move(a_marker)), b_marker_(std::move(b_marker)) {}

        /**
         * Splice the text not covered by tokens back in, as elements of the undefined side.
         * @param input Scanned text
         * @param spans Marked tokens, in order
         */
        std::vector<ParsedElement> infer_unmarked(const std::string& input, const std::vector<Span>& spans) const;

        std::vector<Span> scan(const std::string& input) const;

    protected:
        std::string disguise_symbols(const SymbolStream& symbols, const std::string& public_text) const override;

        SymbolStream reveal_symbols(const std::string& input) const override;

    public:
        ~MarkdownSteganographer() override = default;

        /**
         * Build a steganographer
         * @param a_marker Marker of symbol A (may be empty)
         * @param b_marker Marker of symbol B (may be empty)
         * @return steganographer, or an error if the markers are ambiguous or not defined
         */
        static Result<MarkdownSteganographer> create(Marker a_marker, Marker b_marker);

        /**
         * Tokenize disguised text.
         * Marked spans are returned as A/B elements. With one marker empty, the
         * text around them is returned as elements of that marker's symbol.
         * Missing end markers run to the end of the text.
         */
        std::vector<ParsedElement> parse(const std::string& input) const;

        const Marker& a_marker() const { return this->a_marker_; }
        const Marker& b_marker() const { return this->b_marker_; }

        [[nodiscard]] std::string name() const override { return "markdown"; }
    };
} // Bacon

#endif //BACONSTEGO_MARKDOWNSTEGANOGRAPHER_HH
