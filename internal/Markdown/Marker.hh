#ifndef BACONSTEGO_MARKER_HH
#define BACONSTEGO_MARKER_HH

#include <optional>
#include <string>
#include <utility>

#include <Steganographer.hh>

namespace Bacon
{
    /**
     * Start/end delimiters identifying one symbol in carrier text.
     * A marker is either empty (no delimiters) or fully defined.
     */
    class Marker
    {
    private:
        std::optional<std::string> start_;
        std::optional<std::string> end_;

    public:
        Marker() = default;
        Marker(std::optional<std::string> start, std::optional<std::string> end)
            : start_(std::move(start)), end_(std::move(end)) {}

        static Marker empty() { return Marker(); }

        /**Markdown presets*/
        static Marker emphasis() { return Marker("*", "*"); }
        static Marker strong() { return Marker("**", "**"); }
        static Marker strikethrough() { return Marker("~~", "~~"); }
        static Marker code() { return Marker("`", "`"); }

        const std::optional<std::string>& start() const { return this->start_; }
        const std::optional<std::string>& end() const { return this->end_; }

        /**@return start delimiter or "" if none*/
        std::string start_string() const { return this->start_.value_or(""); }
        /**@return end delimiter or "" if none*/
        std::string end_string() const { return this->end_.value_or(""); }

        bool is_defined() const { return this->start_.has_value() && this->end_.has_value(); }
        bool is_empty() const { return !this->start_.has_value() && !this->end_.has_value(); }

        /**Printable form for messages, e.g. Marker("*", None)*/
        std::string to_string() const;

        bool operator==(const Marker& other) const
        { return this->start_ == other.start_ && this->end_ == other.end_; }

        bool operator!=(const Marker& other) const { return !(*this == other); }
    };

    /**
     * Common checks for a pair of markers: at least one defined, none half defined,
     * no empty delimiter strings.
     * @param owner Class name for the log line
     * @return error or std::nullopt
     */
    std::optional<BaconError> check_marker_pair(const Marker& a_marker, const Marker& b_marker, const char* owner);

    /**
     * Wrap every consumed letter of public_text in the markers of its symbol.
     * @param merge Fuse adjacent spans of the same marker (end+start removed)
     */
    std::string wrap_with_markers(const SymbolStream& symbols, const std::string& public_text,
                                  const Marker& a_marker, const Marker& b_marker, bool merge);

    /**Replace every non-overlapping occurrence of pattern, left to right. Empty pattern: no-op*/
    std::string replace_all(const std::string& text, const std::string& pattern, const std::string& replacement);
} // Bacon

#endif //BACONSTEGO_MARKER_HH
