
#include "Matcher.h"
#include "Highlight.h"
#include "HighlightErrors.h"
#include "Util/Raise.h"

#include <QHash>
#include <QMutex>

#include <gsl/gsl>

#include <algorithm>
#include <utility>

namespace {

// Number of longer match expressions kept, one per remaining length
constexpr int LongerMatchCacheSize = 128;

// PCRE refuses larger repeat counts
constexpr int MaxRepeatCount = 65535;

/**
 * @brief Builds an expression matching exactly `count` characters of any
 * kind.
 *
 * @param count The number of characters.
 * @return The expression.
 */
QString AnyCharacters(int count) {

	QString expression;
	while (count > MaxRepeatCount) {
		expression += QStringLiteral("[\\s\\S]{%1}").arg(MaxRepeatCount);
		count -= MaxRepeatCount;
	}

	expression += QStringLiteral("[\\s\\S]{%1}").arg(count);
	return expression;
}

/**
 * @brief Converts a match into offsets. A capture group set inside a
 * lookaround can lie outside the match; only its part within the match
 * counts.
 *
 * @param m The match.
 * @param group The capture group to style, or 0 for the whole match.
 * @return The match range.
 */
MatchRange ToMatchRange(const QRegularExpressionMatch &m, int group) {

	MatchRange range;
	range.start = gsl::narrow_cast<int>(m.capturedStart());
	range.end   = gsl::narrow_cast<int>(m.capturedEnd());

	if (group == 0) {
		range.groupStart = range.start;
		range.groupEnd   = range.end;
		return range;
	}

	if (m.capturedStart(group) < 0) {
		return range;
	}

	const int groupStart = std::max(range.start, gsl::narrow_cast<int>(m.capturedStart(group)));
	const int groupEnd   = std::min(range.end, gsl::narrow_cast<int>(m.capturedEnd(group)));

	if (groupStart < groupEnd) {
		range.groupStart = groupStart;
		range.groupEnd   = groupEnd;
	}

	return range;
}

}

struct Matcher::LongerMatchCache {
	QMutex mutex;
	QHash<int, QRegularExpression> expressions;
};

/**
 * @brief Compiles a rule expression.
 *
 * @param ruleName The name of the rule the expression belongs to, used when
 * reporting errors.
 * @param pattern The expression, in PCRE syntax.
 * @param group The capture group to style, or 0 for the whole match.
 * @param caseInsensitive Whether letters match regardless of case.
 * @return The compiled matcher.
 *
 * @note Raises PatternCompileError if the expression is malformed or does
 * not have the requested capture group.
 */
Matcher Matcher::compile(const QString &ruleName, const QString &pattern, int group, bool caseInsensitive) {

	if (pattern.isEmpty()) {
		Raise<PatternCompileError>(ruleName, Highlight::tr("pattern is empty"), 0);
	}

	QRegularExpression::PatternOptions options = QRegularExpression::UseUnicodePropertiesOption;
	if (caseInsensitive) {
		options |= QRegularExpression::CaseInsensitiveOption;
	}

	QRegularExpression re(pattern, options);
	if (!re.isValid()) {
		Raise<PatternCompileError>(ruleName, re.errorString(), gsl::narrow_cast<int>(re.patternErrorOffset()));
	}

	if (group < 0 || group > re.captureCount()) {
		Raise<PatternCompileError>(ruleName, Highlight::tr("capture group %1 does not exist (the pattern has %2)").arg(group).arg(re.captureCount()), -1);
	}

	re.optimize();
	return Matcher(std::move(re), group);
}

/**
 * @brief Constructor for the Matcher class.
 *
 * @param re A valid regular expression.
 * @param group The capture group to style, or 0 for the whole match.
 */
Matcher::Matcher(QRegularExpression re, int group)
	: re_(std::move(re)), longer_(std::make_shared<LongerMatchCache>()), group_(group) {
}

/**
 * @brief Finds the leftmost match beginning at or after `from`; of the
 * matches beginning there, the longest. The text of `subject` before `from`
 * is still visible to look-behind assertions and word boundaries.
 *
 * @param subject The text to search.
 * @param from The position where the search begins.
 * @return The match, or an empty optional if there is none.
 */
std::optional<MatchRange> Matcher::match(const QString &subject, int from) const {

	if (from < 0 || from > subject.size()) {
		return {};
	}

	QRegularExpressionMatch m = re_.match(subject, from);
	if (!m.hasMatch()) {
		return {};
	}

	// PCRE settles for the first alternative that matches, so retry at the
	// same start demanding a later end until none is found. Empty matches
	// are skipped by the callers and are left alone.
	const auto start = m.capturedStart();
	while (longer_ && m.capturedLength() > 0 && m.capturedEnd() < subject.size()) {

		const QRegularExpression longer = longerMatchExpression(gsl::narrow_cast<int>(subject.size() - m.capturedEnd()));
		if (!longer.isValid()) {
			break;
		}

		QRegularExpressionMatch next = longer.match(subject, start);
		if (!next.hasMatch()) {
			break;
		}

		m = std::move(next);
	}

	return ToMatchRange(m, group_);
}

/**
 * @brief Gets the expression matching where this one does, but only when
 * fewer than `remaining` characters follow the match.
 *
 * @param remaining The number of characters after the match to beat.
 * @return The expression, anchored at the start offset of the search.
 */
QRegularExpression Matcher::longerMatchExpression(int remaining) const {

	QMutexLocker locker(&longer_->mutex);

	auto it = longer_->expressions.constFind(remaining);
	if (it != longer_->expressions.constEnd()) {
		return *it;
	}

	if (longer_->expressions.size() >= LongerMatchCacheSize) {
		longer_->expressions.clear();
	}

	QRegularExpression re(QStringLiteral("\\G(?:%1)(?!%2)").arg(re_.pattern(), AnyCharacters(remaining)), re_.patternOptions());
	re.optimize();

	longer_->expressions.insert(remaining, re);
	return re;
}

/**
 * @brief Check whether the expression can match without consuming anything,
 * which region start patterns are not allowed to do.
 *
 * @return `true` if the expression matches the empty string.
 */
bool Matcher::matchesEmptyString() const {
	return re_.match(QString()).hasMatch();
}

bool Matcher::isCaseInsensitive() const {
	return re_.patternOptions().testFlag(QRegularExpression::CaseInsensitiveOption);
}

QString Matcher::pattern() const {
	return re_.pattern();
}

int Matcher::group() const {
	return group_;
}
