#include "QueryEngine.h"
#include "../core/TextUtils.h"
#include <SDL3/SDL.h>

QueryResults::iterator::iterator(const QueryResults* owner, size_t pos)
    : owner(owner), pos(pos) {
    seek();
}

void QueryResults::iterator::seek() {
    current = QueryMatch();
    while (pos < owner->snapshot.size()) {
        if (QueryEngine::matchSet(*owner->snapshot[pos], owner->query, current)) return;
        pos++;
    }
    current = QueryMatch();
}

QueryResults::iterator& QueryResults::iterator::operator++() {
    if (owner && pos < owner->snapshot.size()) {
        pos++;
        seek();
    }
    return *this;
}

QueryResults::iterator QueryResults::iterator::operator++(int) {
    iterator old = *this;
    ++(*this);
    return old;
}

QueryResults::QueryResults(std::vector<const BeatmapSet*> snapshot, Query query)
    : snapshot(std::move(snapshot)), query(std::move(query)) {}

std::vector<QueryMatch> QueryResults::collect() const {
    std::vector<QueryMatch> matches;
    for (const auto& match : *this) {
        matches.push_back(match);
    }
    return matches;
}

size_t QueryResults::count() const {
    size_t total = 0;
    for (auto it = begin(); it != end(); ++it) {
        total++;
    }
    return total;
}

bool QueryEngine::parse(const std::string& text, Query& query, IndexError& error) {
    query = Query();

    std::string keyword = text;
    size_t eq = text.find('=');
    if (eq != std::string::npos) {
        std::string field = TextUtils::toLowerAscii(TextUtils::trim(text.substr(0, eq)));
        keyword = text.substr(eq + 1);

        if (field == "sid") query.field = QueryField::SetId;
        else if (field == "name") query.field = QueryField::Title;
        else if (field == "artist") query.field = QueryField::Artist;
        else if (field == "creator") query.field = QueryField::Creator;
        else {
            error = {ErrorKind::QueryError, "",
                     field.empty() ? "missing field before '='" : "unknown field '" + field + "'"};
            return false;
        }
    }

    query.keyword = TextUtils::trim(keyword);
    query.foldedKeyword = TextUtils::foldCase(query.keyword);

    if (query.field == QueryField::SetId && !query.keyword.empty()) {
        bool digitsOnly = query.keyword.find_first_not_of("0123456789") == std::string::npos;
        int64_t id = digitsOnly ? TextUtils::parseIntOr(query.keyword, -1) : -1;
        if (id < 0) {
            error = {ErrorKind::QueryError, "", "sid must be a number: '" + query.keyword + "'"};
            return false;
        }
        query.setId = id;
    }
    return true;
}

bool QueryEngine::matchChart(const ChartRecord& chart, const Query& query) {
    switch (query.field) {
        case QueryField::SetId:
            return chart.beatmapSetId == query.setId;
        case QueryField::Title:
            return TextUtils::containsFolded(chart.title, query.foldedKeyword);
        case QueryField::Artist:
            return TextUtils::containsFolded(chart.artist, query.foldedKeyword);
        case QueryField::Creator:
            return TextUtils::containsFolded(chart.creator, query.foldedKeyword);
        case QueryField::Any:
            return TextUtils::containsFolded(chart.title, query.foldedKeyword) ||
                   TextUtils::containsFolded(chart.artist, query.foldedKeyword) ||
                   TextUtils::containsFolded(chart.creator, query.foldedKeyword);
    }
    return false;
}

bool QueryEngine::matchSet(const BeatmapSet& set, const Query& query, QueryMatch& match) {
    match.set = &set;
    match.charts.clear();

    bool everything = query.matchesEverything() ||
                      (query.field == QueryField::SetId && set.beatmapSetId == query.setId);

    for (size_t i = 0; i < set.charts.size(); i++) {
        if (everything || matchChart(set.charts[i], query)) {
            match.charts.push_back(i);
        }
    }
    return everything || !match.charts.empty();
}

QueryResults QueryEngine::run(const BeatmapIndex& index, const Query& query) {
    std::vector<const BeatmapSet*> snapshot;
    snapshot.reserve(index.size());
    for (const auto& entry : index.sets()) {
        snapshot.push_back(&entry.second);
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[QUERY] field=%d keyword='%s' over %d sets",
                 (int)query.field, query.keyword.c_str(), (int)snapshot.size());
    return QueryResults(std::move(snapshot), query);
}
