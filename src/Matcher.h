
#ifndef MATCHER_H_
#define MATCHER_H_

#include <QRegularExpression>
#include <QString>

#include <memory>
#include <optional>

// Where a matcher matched. The group range is -1 when the matcher styles a
// capture group that didn't take part in the match.
struct MatchRange {
	int start      = -1;
	int end        = -1;
	int groupStart = -1;
	int groupEnd   = -1;

	bool isEmpty() const {
		return start == end;
	}

	bool hasGroup() const {
		return groupStart >= 0 && groupEnd > groupStart;
	}
};

// A compiled rule expression plus the metadata needed to apply it. Used
// alike for single-line rules and for both patterns of a region rule.
// Matches are leftmost, then longest.
class Matcher {
public:
	static Matcher compile(const QString &ruleName, const QString &pattern, int group = 0, bool caseInsensitive = false);

public:
	Matcher()                          = default;
	Matcher(const Matcher &)            = default;
	Matcher &operator=(const Matcher &) = default;
	Matcher(Matcher &&)                 = default;
	Matcher &operator=(Matcher &&)      = default;
	~Matcher()                          = default;

private:
	Matcher(QRegularExpression re, int group);

public:
	std::optional<MatchRange> match(const QString &subject, int from) const;
	bool matchesEmptyString() const;
	bool isCaseInsensitive() const;
	QString pattern() const;
	int group() const;

private:
	QRegularExpression longerMatchExpression(int remaining) const;

private:
	struct LongerMatchCache;

private:
	QRegularExpression re_;
	std::shared_ptr<LongerMatchCache> longer_;
	int group_ = 0;
};

#endif
