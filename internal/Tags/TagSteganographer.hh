#ifndef BACONSTEGO_TAGSTEGANOGRAPHER_HH
#define BACONSTEGO_TAGSTEGANOGRAPHER_HH

#include <optional>
#include <utility>
#include <vector>

#include <Steganographer.hh>
#include <Marker.hh>

namespace Bacon
{
    /**Open/close tag pair, e.g. Tag("<b>", "</b>")*/
    using Tag = Marker;

    /**
     * Hides symbols by wrapping letters in markup tags.
     * Reveal walks the element tree of the disguised text (Qt's QXmlStreamReader),
     * so tags may be nested; a text run belongs to its nearest enclosing tag.
     */
    class TagSteganographer : public Steganographer
    {
    private:
        Tag a_tag_;
        Tag b_tag_;
        std::optional<std::string> a_name_;
        std::optional<std::string> b_name_;
        bool optimize_disguise_ = true;

        TagSteganographer(Tag a_tag, Tag b_tag, std::optional<std::string> a_name, std::optional<std::string> b_name);

        /**
         * Element name of an open/close pair
         * @return "b" for ("<b>", "</b>"), std::nullopt if the pair is malformed
         */
        static std::optional<std::string> element_name(const Tag& tag);

    protected:
        std::string disguise_symbols(const SymbolStream& symbols, const std::string& public_text) const override;

        SymbolStream reveal_symbols(const std::string& input) const override;

    public:
        ~TagSteganographer() override = default;

        /**
         * Build a steganographer
         * @param a_tag Tag of symbol A (may be empty)
         * @param b_tag Tag of symbol B (may be empty)
         * @return steganographer or an error for malformed, missing or identical tags
         */
        static Result<TagSteganographer> create(Tag a_tag, Tag b_tag);

        /**
         * Merge adjacent spans of the same tag in disguise output ("</b><b>" removed). On by default.
         */
        void set_optimize_disguise(bool optimize) { this->optimize_disguise_ = optimize; }

        /**@return copy with one tag pair per hidden letter in disguise output*/
        TagSteganographer no_optimize_disguise_output() const;

        [[nodiscard]] bool optimize_disguise() const { return this->optimize_disguise_; }

        /**
         * Walk the element tree of input depth first.
         * Text under the A/B tag is returned as A/B. Text under other elements or at top level
         * is returned as the undefined side, or dropped when both tags are defined.
         * A '&' that starts no entity reference and a '<' that opens no tag are read as text.
         * Parsing stops at the first markup error; what was read so far is returned.
         */
        std::vector<ParsedElement> parse(const std::string& input) const;

        const Tag& a_tag() const { return this->a_tag_; }
        const Tag& b_tag() const { return this->b_tag_; }

        [[nodiscard]] std::string name() const override { return "tags"; }
    };
} // Bacon

#endif //BACONSTEGO_TAGSTEGANOGRAPHER_HH
