#include "LanguageRegistry.h"
#include "LineTokenizer.h"
#include "NestedLanguage.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

using Highlight::ComputeLineStates;
using Highlight::TokenizeLine;

namespace {

constexpr const char ScriptDefinition[] = R"json({
	"name": "Script",
	"extensions": [".script"],
	"colors": {"keyword": "#569cd6", "number": "#b5cea8", "comment": "#6a9955"},
	"rules": [
		{"name": "keyword", "pattern": "\\b(?:var|let)\\b", "color": "keyword"},
		{"name": "number", "pattern": "\\b\\d+\\b", "color": "number"}
	],
	"multiline_rules": [
		{"name": "block comment", "start": "/\\*", "end": "\\*/", "color": "comment"}
	]
})json";

constexpr const char MarkupDefinition[] = R"json({
	"name": "Markup",
	"extensions": [".markup"],
	"colors": {"tag": "#808080"},
	"rules": [
		{"name": "tag", "pattern": "</?[a-z]+>", "color": "tag"}
	],
	"multiline_rules": [
		{"name": "script", "start": "<script>", "end": "</script>", "color": "tag", "nested_language": "Script"},
		{"name": "embedded", "start": "<embed>", "end": "</embed>", "color": "outside", "nested_language": "Missing"}
	]
})json";

constexpr const char LoopDefinition[] = R"json({
	"name": "Loop",
	"extensions": [".loop"],
	"colors": {"bracket": "#ffffff"},
	"multiline_rules": [
		{"name": "bracket", "start": "\\[", "end": "\\]", "color": "bracket", "nested_language": "Loop"}
	]
})json";

class NestedLanguageTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(registry_.loadSource(QByteArray(ScriptDefinition), QStringLiteral("script")));
		ASSERT_TRUE(registry_.loadSource(QByteArray(MarkupDefinition), QStringLiteral("markup")));
		ASSERT_TRUE(registry_.loadSource(QByteArray(LoopDefinition), QStringLiteral("loop")));
		markup_ = registry_.definitionForName(QStringLiteral("Markup"));
		ASSERT_NE(markup_, nullptr);
	}

protected:
	LanguageRegistry registry_;
	std::shared_ptr<const LanguageDefinition> markup_;
};

}

TEST_F(NestedLanguageTest, InteriorUsesNestedRules) {
	const LineResult result = TokenizeLine(markup_.get(), QStringLiteral("<script>var x = 1;</script>"), LineRegionState(), &registry_);

	const std::vector<SpanSummary> expected = {
		Span(0, 8, "tag"),
		Span(8, 11, "keyword"),
		Span(16, 17, "number"),
		Span(18, 27, "tag"),
	};

	EXPECT_EQ(Summarize(result.spans), expected);
	EXPECT_TRUE(SortedAndDisjoint(result.spans));
	EXPECT_TRUE(result.endState.isPlain());
}

TEST_F(NestedLanguageTest, OffsetsFollowOuterText) {
	const LineResult result = TokenizeLine(markup_.get(), QStringLiteral("<b> <script>let 22</script> <i>"), LineRegionState(), &registry_);

	const std::vector<SpanSummary> expected = {
		Span(0, 3, "tag"),
		Span(4, 12, "tag"),
		Span(12, 15, "keyword"),
		Span(16, 18, "number"),
		Span(18, 27, "tag"),
		Span(28, 31, "tag"),
	};

	EXPECT_EQ(Summarize(result.spans), expected);
}

TEST_F(NestedLanguageTest, MissingLanguageFallsBackToFlatStyle) {
	LanguageRegistry empty;

	const LineResult result = TokenizeLine(markup_.get(), QStringLiteral("<script>var x = 1;</script>"), LineRegionState(), &empty);
	EXPECT_EQ(Summarize(result.spans), std::vector<SpanSummary>{Span(0, 27, "tag")});

	// without a nested language or a resolvable role there is nothing to draw
	const LineResult embedded = TokenizeLine(markup_.get(), QStringLiteral("<embed>1</embed><b>"), LineRegionState(), &registry_);
	EXPECT_EQ(Summarize(embedded.spans), std::vector<SpanSummary>{Span(16, 19, "tag")});
}

TEST_F(NestedLanguageTest, NestedStateCrossesLines) {
	const QStringList lines = {
		QStringLiteral("<script>"),
		QStringLiteral("/* open"),
		QStringLiteral("still */ var"),
		QStringLiteral("</script> <b>"),
	};

	const std::shared_ptr<const LanguageDefinition> script = registry_.definitionForName(QStringLiteral("Script"));

	const std::vector<LineRegionState> states = ComputeLineStates(lines, markup_.get(), &registry_);
	ASSERT_EQ(states.size(), 4u);

	EXPECT_TRUE(states[0].isPlain());

	EXPECT_EQ(states[1].activeRegion(), 0u);
	EXPECT_EQ(states[1].activeNestedLanguage(), script);
	EXPECT_TRUE(states[1].nestedState().isPlain());

	EXPECT_EQ(states[2].activeRegion(), 0u);
	EXPECT_EQ(states[2].nestedState().activeRegion(), 0u);

	EXPECT_EQ(states[3].activeRegion(), 0u);
	EXPECT_TRUE(states[3].nestedState().isPlain());

	const LineResult third = TokenizeLine(markup_.get(), lines[2], states[2], &registry_);
	const std::vector<SpanSummary> expected = {Span(0, 8, "comment"), Span(9, 12, "keyword")};
	EXPECT_EQ(Summarize(third.spans), expected);

	const LineResult last = TokenizeLine(markup_.get(), lines[3], states[3], &registry_);
	const std::vector<SpanSummary> closing = {Span(0, 9, "tag"), Span(10, 13, "tag")};
	EXPECT_EQ(Summarize(last.spans), closing);
	EXPECT_TRUE(last.endState.isPlain());
}

TEST_F(NestedLanguageTest, RecursionIsBounded) {
	const std::shared_ptr<const LanguageDefinition> loop = registry_.definitionForName(QStringLiteral("Loop"));
	ASSERT_NE(loop, nullptr);

	const LineResult result = TokenizeLine(loop.get(), QString(20, QLatin1Char('[')), LineRegionState(), &registry_);

	ASSERT_EQ(result.endState.frames.size(), static_cast<size_t>(MAX_NESTING_DEPTH + 1));
	EXPECT_EQ(result.endState.frames.back().nestedLanguage, nullptr);
	EXPECT_EQ(Summarize(result.spans), std::vector<SpanSummary>{Span(0, 20, "bracket")});
}

TEST_F(NestedLanguageTest, ResolvesNestedLanguageByName) {
	ASSERT_EQ(markup_->regions.size(), 2u);

	EXPECT_EQ(Highlight::ResolveNestedLanguage(markup_->regions[0], &registry_), registry_.definitionForName(QStringLiteral("Script")));
	EXPECT_EQ(Highlight::ResolveNestedLanguage(markup_->regions[1], &registry_), nullptr);
	EXPECT_EQ(Highlight::ResolveNestedLanguage(markup_->regions[0], nullptr), nullptr);
}
