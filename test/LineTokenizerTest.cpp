#include "LanguageDefinition.h"
#include "LineTokenizer.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

using Highlight::ComputeLineStates;
using Highlight::TokenizeLine;
using Highlight::TokenizeRules;

namespace {

LineStyles Tokenize(const LanguageDefinition &language, const QString &line) {
	return TokenizeLine(&language, line, LineRegionState(), nullptr).spans;
}

LanguageDefinition RulesOnly(const char *rules) {
	const QString json = QStringLiteral(R"json({"name": "Rules", "extensions": [".rules"],
		"colors": {"a": "#ff0000", "b": "#00ff00", "c": "#0000ff"}, "rules": %1})json")
		.arg(QString::fromLatin1(rules));

	return LoadTestDefinition(json.toUtf8().constData());
}

}

TEST(LineTokenizerTest, EmptyLineHasNoSpans) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	const LineResult result = TokenizeLine(&language, QString(), LineRegionState(), nullptr);
	EXPECT_TRUE(result.spans.empty());
	EXPECT_TRUE(result.endState.isPlain());
}

TEST(LineTokenizerTest, PlainTextWithoutLanguage) {
	const LineResult result = TokenizeLine(nullptr, QStringLiteral("int x = 1;"), LineRegionState(), nullptr);
	EXPECT_TRUE(result.spans.empty());
	EXPECT_TRUE(result.endState.isPlain());
}

TEST(LineTokenizerTest, StylesTokens) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	const std::vector<SpanSummary> expected = {
		Span(0, 3, "keyword"),
		Span(4, 5, "ident"),
		Span(8, 10, "number"),
		Span(11, 18, "comment"),
	};

	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("int x = 42 // note"))), expected);
}

TEST(LineTokenizerTest, EarlierRuleWinsOverlap) {
	const LanguageDefinition fooFirst = RulesOnly(R"([
		{"name": "foo", "pattern": "foo\\w*", "color": "a"},
		{"name": "bar", "pattern": "\\w*bar", "color": "b"}
	])");

	const LanguageDefinition barFirst = RulesOnly(R"([
		{"name": "bar", "pattern": "\\w*bar", "color": "b"},
		{"name": "foo", "pattern": "foo\\w*", "color": "a"}
	])");

	EXPECT_EQ(Summarize(Tokenize(fooFirst, QStringLiteral("foobar"))), std::vector<SpanSummary>{Span(0, 6, "a")});
	EXPECT_EQ(Summarize(Tokenize(barFirst, QStringLiteral("foobar"))), std::vector<SpanSummary>{Span(0, 6, "b")});
}

TEST(LineTokenizerTest, PartialOverlapIsRejected) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "pair", "pattern": "ab", "color": "a"},
		{"name": "tail", "pattern": "bc", "color": "b"},
		{"name": "single", "pattern": "c", "color": "c"}
	])");

	const std::vector<SpanSummary> expected = {Span(0, 2, "a"), Span(2, 3, "c")};
	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("abc"))), expected);
}

TEST(LineTokenizerTest, HigherPriorityRuleComesFirst) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "word", "pattern": "\\w+", "color": "a"},
		{"name": "todo", "pattern": "TODO", "color": "b", "priority": 10}
	])");

	const std::vector<SpanSummary> expected = {Span(0, 4, "b"), Span(5, 9, "a")};
	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("TODO item"))), expected);
}

TEST(LineTokenizerTest, CaptureGroupClaimsWholeMatch) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "function name", "pattern": "function\\s+(\\w+)\\s*\\(", "color": "a", "group": 1},
		{"name": "identifier", "pattern": "\\b\\w+\\b", "color": "b"}
	])");

	const std::vector<SpanSummary> expected = {Span(9, 12, "a"), Span(13, 14, "b")};
	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("function foo(x)"))), expected);
}

TEST(LineTokenizerTest, EmptyGroupStylesNothingButConsumes) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "optional", "pattern": "x(y?)", "color": "a", "group": 1},
		{"name": "letter", "pattern": "x", "color": "b"}
	])");

	EXPECT_TRUE(Tokenize(language, QStringLiteral("x")).empty());

	const std::vector<SpanSummary> expected = {Span(3, 4, "a")};
	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("x xy"))), expected);
}

TEST(LineTokenizerTest, ZeroWidthMatchesAreSkipped) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "star", "pattern": "a*", "color": "a"},
		{"name": "boundary", "pattern": "\\b", "color": "b"}
	])");

	const std::vector<SpanSummary> expected = {Span(1, 3, "a")};
	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("baab"))), expected);

	const QString longLine(20000, QLatin1Char('b'));
	EXPECT_TRUE(Tokenize(language, longLine).empty());
}

TEST(LineTokenizerTest, GroupOutsideMatchStylesNothing) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "before bc", "pattern": "a(?=(bc))", "color": "a", "group": 1},
		{"name": "b", "pattern": "b", "color": "b"}
	])");

	const LineStyles spans = Tokenize(language, QStringLiteral("abc"));
	EXPECT_EQ(Summarize(spans), std::vector<SpanSummary>{Span(1, 2, "b")});
	EXPECT_TRUE(SortedAndDisjoint(spans));
}

TEST(LineTokenizerTest, LongestAlternativeWins) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "a or ab", "pattern": "a|ab", "color": "a"},
		{"name": "b", "pattern": "b", "color": "b"}
	])");

	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("ab"))), std::vector<SpanSummary>{Span(0, 2, "a")});
	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("a b"))), (std::vector<SpanSummary>{Span(0, 1, "a"), Span(2, 3, "b")}));
}

TEST(LineTokenizerTest, ZeroWidthSkipStepsOverSurrogatePairs) {
	const LanguageDefinition language = RulesOnly(R"([
		{"name": "digits", "pattern": "[0-9]*", "color": "a"}
	])");

	// U+1F600 takes two UTF-16 code units
	const QString line = QString::fromUtf8("\xF0\x9F\x98\x80 42");
	EXPECT_EQ(Summarize(Tokenize(language, line)), std::vector<SpanSummary>{Span(3, 5, "a")});

	const LanguageDefinition regions = LoadTestDefinition(R"json({
		"name": "Marks",
		"extensions": [".marks"],
		"colors": {"mark": "#ffffff"},
		"multiline_rules": [
			{"name": "marked", "start": "x*", "end": "y", "color": "mark"}
		]
	})json");

	const LineResult result = TokenizeLine(&regions, QString::fromUtf8("\xF0\x9F\x98\x80x"), LineRegionState(), nullptr);
	EXPECT_EQ(Summarize(result.spans), std::vector<SpanSummary>{Span(2, 3, "mark")});
	EXPECT_EQ(result.endState.activeRegion(), 0u);
}

TEST(LineTokenizerTest, SpansAreSortedAndDisjoint) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	const QString lines[] = {
		QStringLiteral("int main() { return \"str // not a comment\" + 1; } // comment"),
		QStringLiteral("x /* a */ y /* b */ z"),
		QStringLiteral("\"unterminated /* string"),
		QStringLiteral("return 0 1 2 3 int"),
	};

	for (const QString &line : lines) {
		const LineStyles spans = Tokenize(language, line);
		EXPECT_TRUE(SortedAndDisjoint(spans)) << line.toStdString();
	}
}

TEST(LineTokenizerTest, TokenizingIsIdempotent) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);
	const QString line                = QStringLiteral("int a = 1; /* open");

	LineRegionState state;
	state.frames.push_back(RegionFrame{0, nullptr});

	EXPECT_EQ(TokenizeLine(&language, line, LineRegionState(), nullptr).spans, TokenizeLine(&language, line, LineRegionState(), nullptr).spans);
	EXPECT_EQ(TokenizeLine(&language, line, state, nullptr).spans, TokenizeLine(&language, line, state, nullptr).spans);
	EXPECT_EQ(TokenizeLine(&language, line, state, nullptr).endState, TokenizeLine(&language, line, state, nullptr).endState);
}

TEST(LineTokenizerTest, RegionPropagatesAcrossLines) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);
	const QStringList lines           = {QStringLiteral("/* start"), QStringLiteral("middle"), QStringLiteral("end */ code")};

	const LineResult first = TokenizeLine(&language, lines[0], LineRegionState(), nullptr);
	EXPECT_EQ(Summarize(first.spans), std::vector<SpanSummary>{Span(0, 8, "comment")});
	EXPECT_EQ(first.endState.activeRegion(), 0u);

	const LineResult second = TokenizeLine(&language, lines[1], first.endState, nullptr);
	EXPECT_EQ(Summarize(second.spans), std::vector<SpanSummary>{Span(0, 6, "comment")});
	EXPECT_EQ(second.endState.activeRegion(), 0u);

	const LineResult third = TokenizeLine(&language, lines[2], second.endState, nullptr);
	const std::vector<SpanSummary> expected = {Span(0, 6, "comment"), Span(7, 11, "ident")};
	EXPECT_EQ(Summarize(third.spans), expected);
	EXPECT_TRUE(third.endState.isPlain());

	const std::vector<LineRegionState> states = ComputeLineStates(lines, &language, nullptr);
	ASSERT_EQ(states.size(), 3u);
	EXPECT_TRUE(states[0].isPlain());
	EXPECT_EQ(states[1].activeRegion(), 0u);
	EXPECT_EQ(states[2].activeRegion(), 0u);
}

TEST(LineTokenizerTest, RegionStartsBeforeSingleLineRules) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	const std::vector<SpanSummary> expected = {
		Span(0, 3, "keyword"),
		Span(4, 5, "ident"),
		Span(8, 9, "number"),
		Span(11, 18, "comment"),
		Span(19, 25, "keyword"),
	};

	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("int a = 1; /* c */ return"))), expected);

	// the region wins even inside what a single-line rule would match
	const std::vector<SpanSummary> inString = {Span(1, 2, "ident"), Span(3, 8, "comment")};
	const LineResult result                 = TokenizeLine(&language, QStringLiteral("\"a /* b\""), LineRegionState(), nullptr);
	EXPECT_EQ(Summarize(result.spans), inString);
	EXPECT_EQ(result.endState.activeRegion(), 0u);
}

TEST(LineTokenizerTest, SeveralRegionsOnOneLine) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	const LineResult result = TokenizeLine(&language, QStringLiteral("/* a */ x /* b"), LineRegionState(), nullptr);

	const std::vector<SpanSummary> expected = {Span(0, 7, "comment"), Span(8, 9, "ident"), Span(10, 14, "comment")};
	EXPECT_EQ(Summarize(result.spans), expected);
	EXPECT_EQ(result.endState.activeRegion(), 0u);
}

TEST(LineTokenizerTest, FirstDeclaredRegionWinsTie) {
	const LanguageDefinition language = LoadTestDefinition(R"json({
		"name": "Docs",
		"extensions": [".docs"],
		"colors": {"doc": "#608b4e", "comment": "#6a9955"},
		"multiline_rules": [
			{"name": "doc comment", "start": "/\\*\\*", "end": "\\*/", "color": "doc"},
			{"name": "block comment", "start": "/\\*", "end": "\\*/", "color": "comment"}
		]
	})json");

	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("/** x */"))), std::vector<SpanSummary>{Span(0, 8, "doc")});
	EXPECT_EQ(Summarize(Tokenize(language, QStringLiteral("/* x */"))), std::vector<SpanSummary>{Span(0, 7, "comment")});
}

TEST(LineTokenizerTest, ZeroWidthRegionEnd) {
	const LanguageDefinition language = LoadTestDefinition(R"json({
		"name": "Lines",
		"extensions": [".lines"],
		"colors": {"comment": "#6a9955", "word": "#ffffff"},
		"rules": [{"name": "word", "pattern": "\\w+", "color": "word"}],
		"multiline_rules": [
			{"name": "to end of line", "start": ";", "end": "$", "color": "comment"}
		]
	})json");

	const LineResult result = TokenizeLine(&language, QStringLiteral("a ;b"), LineRegionState(), nullptr);

	const std::vector<SpanSummary> expected = {Span(0, 1, "word"), Span(2, 4, "comment")};
	EXPECT_EQ(Summarize(result.spans), expected);
	EXPECT_TRUE(result.endState.isPlain());
}

TEST(LineTokenizerTest, OffsetsAreUtf16CodeUnits) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	// U+1F600 takes two UTF-16 code units
	const QString line = QString::fromUtf8("\xF0\x9F\x98\x80 int");
	EXPECT_EQ(Summarize(Tokenize(language, line)), std::vector<SpanSummary>{Span(3, 6, "keyword")});
}

TEST(LineTokenizerTest, InvalidStateIsReset) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	LineRegionState state;
	state.frames.push_back(RegionFrame{42, nullptr});

	const LineResult result = TokenizeLine(&language, QStringLiteral("int"), state, nullptr);
	EXPECT_EQ(Summarize(result.spans), std::vector<SpanSummary>{Span(0, 3, "keyword")});
	EXPECT_TRUE(result.endState.isPlain());
}

TEST(LineTokenizerTest, RulesAloneIgnoreRegions) {
	const LanguageDefinition language = LoadTestDefinition(CLikeDefinition);

	const std::vector<SpanSummary> expected = {Span(3, 7, "ident"), Span(11, 12, "number")};
	EXPECT_EQ(Summarize(TokenizeRules(language.rules, QStringLiteral("/* this */ 1"))), expected);
}
