#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <CharCodec.hh>
#include <MarkdownSteganographer.hh>

using Bacon::ElementType;
using Bacon::Marker;
using Bacon::MarkdownSteganographer;
using Bacon::ParsedElement;

namespace
{
    const std::string kSecret = "My secret";
    const std::string kPublic = "This is a public message that contains a secret one";

    MarkdownSteganographer make(const Marker& a, const Marker& b)
    {
        Bacon::Result<MarkdownSteganographer> s = MarkdownSteganographer::create(a, b);
        EXPECT_TRUE(s.ok());
        return s.value();
    }
}

TEST(MarkerTest, Creation)
{
    Marker m1(std::nullopt, std::nullopt);
    EXPECT_FALSE(m1.start().has_value());
    EXPECT_FALSE(m1.end().has_value());
    EXPECT_TRUE(m1.is_empty());
    EXPECT_EQ(Marker::empty(), m1);

    Marker m2("_", "_");
    EXPECT_EQ("_", *m2.start());
    EXPECT_EQ("_", *m2.end());
    EXPECT_TRUE(m2.is_defined());

    Marker half("_", std::nullopt);
    EXPECT_FALSE(half.is_defined());
    EXPECT_FALSE(half.is_empty());
}

TEST(MarkerTest, Strings)
{
    EXPECT_EQ("**", Marker::strong().start_string());
    EXPECT_EQ("**", Marker::strong().end_string());
    EXPECT_EQ("", Marker::empty().start_string());
    EXPECT_EQ("Marker(\"~~\", None)", Marker("~~", std::nullopt).to_string());
}

TEST(MarkerTest, ReplaceAll)
{
    EXPECT_EQ("*ab*", Bacon::replace_all("*a**b*", "**", ""));
    EXPECT_EQ("**ab**", Bacon::replace_all("**a****b**", "****", ""));
    EXPECT_EQ("abc", Bacon::replace_all("abc", "", "x"));
}

TEST(MarkdownSteganographerTest, CreationFailsOnOverlappingMarkers)
{
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("*", "*"), Marker("**", "**")).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("*", "!"), Marker("@", "**")).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("!", "*"), Marker("**", "@")).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("**", "**"), Marker("*", "*")).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("**", "@"), Marker("*", "!")).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("@", "**"), Marker("!", "*")).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("**", "**"), Marker("**", "**")).ok());
}

TEST(MarkdownSteganographerTest, CreationFailsOnUndefinedMarkers)
{
    Bacon::Result<MarkdownSteganographer> none = MarkdownSteganographer::create(Marker::empty(), Marker::empty());
    ASSERT_FALSE(none.ok());
    EXPECT_EQ(Bacon::ErrorKind::Steganographer, none.error().kind());

    EXPECT_FALSE(MarkdownSteganographer::create(Marker("*", std::nullopt), Marker::empty()).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker::empty(), Marker(std::nullopt, "*")).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("*", "*"), Marker("!", std::nullopt)).ok());
    EXPECT_FALSE(MarkdownSteganographer::create(Marker("", ""), Marker::empty()).ok());
}

TEST(MarkdownSteganographerTest, CreationAcceptsDistinctMarkers)
{
    EXPECT_TRUE(MarkdownSteganographer::create(Marker("*", "*"), Marker("!", "!")).ok());
    EXPECT_TRUE(MarkdownSteganographer::create(Marker::strong(), Marker::empty()).ok());
    EXPECT_TRUE(MarkdownSteganographer::create(Marker::empty(), Marker::emphasis()).ok());
    EXPECT_TRUE(MarkdownSteganographer::create(Marker::strikethrough(), Marker::code()).ok());
}

TEST(MarkdownSteganographerTest, DisguiseWithBMarker)
{
    Bacon::CharCodec<char> codec('a', 'b');
    MarkdownSteganographer s = make(Marker::empty(), Marker("*", "*"));

    Bacon::Result<std::string> output = s.disguise(kSecret, kPublic, codec);
    ASSERT_TRUE(output.ok());
    EXPECT_EQ("T*h*i*s* *is* a *pu*b*l*ic m*e*ss*a*ge tha*t* c*o*ntains *a* se*c*re*t* one", output.value());
}

TEST(MarkdownSteganographerTest, DisguiseWithAMarker)
{
    Bacon::CharCodec<char> codec('a', 'b');
    MarkdownSteganographer s = make(Marker("**", "**"), Marker::empty());

    Bacon::Result<std::string> output = s.disguise(kSecret, kPublic, codec);
    ASSERT_TRUE(output.ok());
    EXPECT_EQ("**T**h**i**s is **a** pu**b**l**ic** **m**e**ss**a**ge** **tha**t **c**o**ntains** a **se**c**re**t **o**ne",
              output.value());
}

TEST(MarkdownSteganographerTest, DisguiseWithBothMarkers)
{
    Bacon::CharCodec<char> codec('a', 'b');
    MarkdownSteganographer s = make(Marker("*", "*"), Marker("!", "!"));

    Bacon::Result<std::string> output = s.disguise(kSecret, kPublic, codec);
    ASSERT_TRUE(output.ok());
    EXPECT_EQ("*T*!h!*i*!s! !is! *a* !pu!*b*!l!*ic* *m*!e!*ss*!a!*ge* *tha*!t! *c*!o!*ntains* !a! *se*!c!*re*!t! *o*ne",
              output.value());
}

TEST(MarkdownSteganographerTest, ParseBothMarkers)
{
    MarkdownSteganographer s = make(Marker("*", "*"), Marker("!", "!"));
    const std::vector<ParsedElement> expected = {
        {"T", ElementType::A}, {"h", ElementType::B}, {"ic", ElementType::A}, {"ss", ElementType::B}
    };
    EXPECT_EQ(expected, s.parse("*T*!h! x *ic* y !ss! tail"));
}

TEST(MarkdownSteganographerTest, ParseInfersUnmarkedSide)
{
    MarkdownSteganographer s = make(Marker::empty(), Marker("[", "]"));
    const std::vector<ParsedElement> expected = {
        {"x", ElementType::A}, {"yz", ElementType::B}, {"w", ElementType::A}
    };
    EXPECT_EQ(expected, s.parse("x[yz]w"));

    MarkdownSteganographer t = make(Marker("[", "]"), Marker::empty());
    const std::vector<ParsedElement> expected_b = {
        {"a", ElementType::A}, {"b", ElementType::B}, {" ", ElementType::B}
    };
    EXPECT_EQ(expected_b, t.parse("[a]b "));
}

TEST(MarkdownSteganographerTest, ParseClampsMissingEndMarker)
{
    MarkdownSteganographer s = make(Marker("<<", ">>"), Marker("{", "}"));
    const std::vector<ParsedElement> expected = {
        {"ab", ElementType::A}, {"cd", ElementType::B}
    };
    EXPECT_EQ(expected, s.parse("<<ab>> {cd"));

    // Start marker with nothing after it
    const std::vector<ParsedElement> only_first = {{"ab", ElementType::A}};
    EXPECT_EQ(only_first, s.parse("<<ab>> {"));
    EXPECT_TRUE(s.parse("").empty());
}

TEST(MarkdownSteganographerTest, RevealWithBothMarkers)
{
    Bacon::CharCodec<char> codec('a', 'b');
    MarkdownSteganographer s = make(Marker("*", "*"), Marker("!", "!"));

    Bacon::Result<std::string> output = s.reveal(
        "*T*!h!*i*!s! !is! *a* !pu!*b*!l!*ic* *m*!e!*ss*!a!*ge* *tha*!t! *c*!o!*ntains* !a! *se*!c!*re*!t! *o*ne", codec);
    ASSERT_TRUE(output.ok());
    EXPECT_EQ(0u, output.value().rfind("MYSECRET", 0));
}

TEST(MarkdownSteganographerTest, RoundTripWithBMarkerOnly)
{
    Bacon::CharCodec<char> codec('a', 'b');
    MarkdownSteganographer s = make(Marker::empty(), Marker::emphasis());

    Bacon::Result<std::string> disguised = s.disguise(kSecret, kPublic, codec);
    ASSERT_TRUE(disguised.ok());
    Bacon::Result<std::string> revealed = s.reveal(disguised.value(), Bacon::CharCodec<char>('A', 'B'));
    ASSERT_TRUE(revealed.ok());
    EXPECT_EQ(0u, revealed.value().rfind("MYSECRET", 0));
}

TEST(MarkdownSteganographerTest, RoundTripWithAMarkerOnly)
{
    Bacon::CharCodec<char> codec('a', 'b');
    MarkdownSteganographer s = make(Marker::strong(), Marker::empty());

    Bacon::Result<std::string> disguised = s.disguise(kSecret, kPublic, codec);
    ASSERT_TRUE(disguised.ok());
    Bacon::Result<std::string> revealed = s.reveal(disguised.value(), codec);
    ASSERT_TRUE(revealed.ok());
    EXPECT_EQ(0u, revealed.value().rfind("MYSECRET", 0));
}

TEST(MarkdownSteganographerTest, RoundTripWithMultiCharMarkersAndBools)
{
    Bacon::CharCodecV2<bool> codec(false, true);
    MarkdownSteganographer s = make(Marker::strikethrough(), Marker("<!", "!>"));

    const std::string secret = "just a quick victory";
    const std::string cover = "Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor "
                              "incididunt ut labore et dolore magna aliqua. Ut enim ad minim veniam, quis nostrud "
                              "exercitation ullamco laboris nisi ut aliquip ex ea commodo consequat.";
    Bacon::Result<std::string> disguised = s.disguise(secret, cover, codec);
    ASSERT_TRUE(disguised.ok());
    Bacon::Result<std::string> revealed = s.reveal(disguised.value(), codec);
    ASSERT_TRUE(revealed.ok());
    EXPECT_EQ(0u, revealed.value().rfind("JUSTAQUICKVICTORY", 0));
}

TEST(MarkdownSteganographerTest, ShortPublicTextHidesWhatFits)
{
    Bacon::CharCodec<char> codec('a', 'b');
    MarkdownSteganographer s = make(Marker::empty(), Marker("*", "*"));

    Bacon::Result<std::string> output = s.disguise(kSecret, "Short public", codec);
    ASSERT_TRUE(output.ok());
    EXPECT_EQ("S*h*o*rt* *p*u*bl*i*c*", output.value());
}
