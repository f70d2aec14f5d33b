#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>
#include "BeatmapIndex.h"
#include "../core/IndexError.h"

enum class QueryField {
    Any,      // Title, artist or creator
    SetId,    // sid=
    Title,    // name=
    Artist,   // artist=
    Creator   // creator=
};

struct Query {
    QueryField field = QueryField::Any;
    std::string keyword;        // Trimmed, as typed
    std::string foldedKeyword;  // Case-folded keyword for substring matching
    int64_t setId = 0;          // Parsed keyword for QueryField::SetId

    bool matchesEverything() const { return keyword.empty(); }
};

struct QueryMatch {
    const BeatmapSet* set = nullptr;
    std::vector<size_t> charts;  // Indices into set->charts that matched
};

// Lazily filtered view over a snapshot of the index, in folder path order.
// Can be iterated any number of times; valid while the index is unchanged.
class QueryResults {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = QueryMatch;
        using difference_type = std::ptrdiff_t;
        using pointer = const QueryMatch*;
        using reference = const QueryMatch&;

        iterator() = default;
        reference operator*() const { return current; }
        pointer operator->() const { return &current; }
        iterator& operator++();
        iterator operator++(int);
        bool operator==(const iterator& other) const { return owner == other.owner && pos == other.pos; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class QueryResults;
        iterator(const QueryResults* owner, size_t pos);
        void seek();

        const QueryResults* owner = nullptr;
        size_t pos = 0;
        QueryMatch current;
    };

    QueryResults(std::vector<const BeatmapSet*> snapshot, Query query);

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, snapshot.size()); }

    std::vector<QueryMatch> collect() const;
    size_t count() const;

private:
    std::vector<const BeatmapSet*> snapshot;
    Query query;
};

class QueryEngine {
public:
    // Parses "[field=]keyword"; unknown fields and bad ids are a QueryError
    static bool parse(const std::string& text, Query& query, IndexError& error);

    static QueryResults run(const BeatmapIndex& index, const Query& query);

    // Fills match.charts; true if the set satisfies the query
    static bool matchSet(const BeatmapSet& set, const Query& query, QueryMatch& match);

private:
    static bool matchChart(const ChartRecord& chart, const Query& query);
};
