#include "opf_parser.h"
#include "test_support.h"

#include <gtest/gtest.h>

namespace {

constexpr auto FullOpf = R"(<?xml version="1.0" encoding="utf-8"?>
<package xmlns="http://www.idpf.org/2007/opf" unique-identifier="uuid_id" version="2.0">
  <metadata xmlns:dc="http://purl.org/dc/elements/1.1/" xmlns:opf="http://www.idpf.org/2007/opf">
    <dc:identifier opf:scheme="calibre" id="calibre_id">12</dc:identifier>
    <dc:identifier opf:scheme="ISBN">9780441013593</dc:identifier>
    <dc:title>Dune</dc:title>
    <dc:creator opf:role="aut">Frank Herbert</dc:creator>
    <dc:description>&lt;p&gt;Set on the desert planet &lt;b&gt;Arrakis&lt;/b&gt;,
      Dune is the story of &amp;quot;Paul&amp;quot;.&lt;/p&gt;</dc:description>
    <dc:publisher>Ace</dc:publisher>
    <dc:date>1965-08-01T00:00:00+00:00</dc:date>
    <dc:language>eng</dc:language>
    <meta name="calibre:series" content="Dune"/>
    <meta name="calibre:series_index" content="1.0"/>
    <meta name="calibre:rating" content="10"/>
  </metadata>
</package>)";

} // namespace

TEST(OPFParser, ReadsCalibreMetadata)
{
	TempDir dir;
	write_file(dir / "metadata.opf", FullOpf);

	const auto details = OPFParser::parse(dir / "metadata.opf");
	ASSERT_TRUE(details);
	EXPECT_EQ(details->description,
	          "Set on the desert planet Arrakis , Dune is the story of \"Paul\".");
	EXPECT_EQ(details->publisher, "Ace");
	EXPECT_EQ(details->published, "1965-08-01");
	EXPECT_EQ(details->language, "eng");
	EXPECT_EQ(details->series, "Dune");
	EXPECT_EQ(details->series_index, "1.0");
	EXPECT_EQ(details->isbn, "9780441013593");
	EXPECT_EQ(details->rating, 10);
}

TEST(OPFParser, UndefinedDateAndMissingFieldsStayEmpty)
{
	TempDir dir;
	write_file(dir / "metadata.opf", R"(<package><metadata>
		<dc:date>0101-01-01T00:00:00+00:00</dc:date>
	</metadata></package>)");

	const auto details = OPFParser::parse(dir / "metadata.opf");
	ASSERT_TRUE(details);
	EXPECT_TRUE(details->published.empty());
	EXPECT_TRUE(details->description.empty());
	EXPECT_FALSE(details->rating);
}

TEST(OPFParser, MalformedOrMissingFileGivesNothing)
{
	TempDir dir;
	write_file(dir / "broken.opf", "<package><metadata>");
	write_file(dir / "other.opf", "<html><body/></html>");

	EXPECT_FALSE(OPFParser::parse(dir / "broken.opf"));
	EXPECT_FALSE(OPFParser::parse(dir / "other.opf"));
	EXPECT_FALSE(OPFParser::parse(dir / "missing.opf"));
}

TEST(OPFParser, StripHtmlKeepsTextOnly)
{
	EXPECT_EQ(OPFParser::strip_html("<div><p>One&nbsp;&amp; two</p>\n<p>three</p></div>"),
	          "One & two three");
	EXPECT_EQ(OPFParser::strip_html("plain"), "plain");
	EXPECT_EQ(OPFParser::strip_html(""), "");
}
