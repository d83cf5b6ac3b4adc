#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/store.hpp"
#include "../support/fixtures.hpp"
#include <array>
#include <tuple>

using namespace sparkle;
using sparkle::test::TestStore;

namespace {

const std::array<std::string, 4> kNames{"甲", "乙", "丙", "丁"};

// Failures a random sequence is allowed to provoke. Anything else is a bug.
template<typename T>
void expect_benign(const Result<T, Error>& result) {
    if (result.is_ok()) return;
    const auto& error = result.unwrap_err();
    RC_ASSERT(error.kind != ErrorKind::Storage);
    RC_ASSERT(error.kind != ErrorKind::MigrationFailure);
    RC_ASSERT(error.kind != ErrorKind::AggregateRefreshFailure);
}

void check_aggregates(storage::Store& store) {
    auto themes = store.themes().list().unwrap();
    int64_t cached_total = 0;
    for (const auto& theme : themes) {
        RC_ASSERT(theme.inspiration_count == store.inspirations().count_by_theme(theme.name).unwrap());
        cached_total += theme.inspiration_count;
    }
    RC_ASSERT(cached_total == store.inspirations().count().unwrap());
    RC_ASSERT(store.inspirations().find_orphans().unwrap().empty());
    RC_ASSERT(store.validator().check().unwrap().is_valid());
}

} // namespace

TEST_CASE("Property: the cached count follows inserts", "[property][themes]") {
    rc::check("N saves into one theme leave inspirationCount == N",
        [](uint8_t raw) {
            const int n = raw % 40;
            TestStore s;
            s.add_theme("设计");
            for (int i = 0; i < n; ++i) {
                s.add_note("note " + std::to_string(i), "设计");
            }
            RC_ASSERT(s->themes().get("设计").unwrap()->inspiration_count == n);
            RC_ASSERT(s->inspirations().count_by_theme("设计").unwrap() == n);
        }
    );
}

TEST_CASE("Property: random operations keep aggregates exact", "[property][themes]") {
    using Op = std::tuple<int, int, int>;
    const auto ops_gen = rc::gen::container<std::vector<Op>>(
        rc::gen::tuple(rc::gen::inRange(0, 5), rc::gen::inRange(0, 4), rc::gen::inRange(0, 4)));

    rc::check("no sequence of coordinator calls leaves orphans or stale counts",
        [&] {
            const auto ops = *ops_gen;
            TestStore s;
            auto& store = *s.store;
            auto& coordinator = store.coordinator();

            for (const auto& [kind, a, b] : ops) {
                const auto& first = kNames[a];
                const auto& second = kNames[b];
                switch (kind) {
                    case 0:
                        expect_benign(coordinator.create_theme(create_theme(first, s.clock->now())));
                        break;
                    case 1:
                        expect_benign(coordinator.save_inspiration(
                            create_inspiration("idea for " + first, first, s.clock->now())));
                        break;
                    case 2:
                        expect_benign(coordinator.rename_theme(first, second));
                        break;
                    case 3:
                        expect_benign(coordinator.delete_theme(
                            first, a == b ? std::nullopt : std::optional<std::string>(second)));
                        break;
                    default: {
                        auto notes = store.inspirations().get_all().unwrap();
                        if (!notes.empty()) {
                            const auto& victim = notes[static_cast<size_t>(b) % notes.size()];
                            RC_ASSERT(coordinator.delete_inspiration(victim.id).is_ok());
                        }
                        break;
                    }
                }
                s.clock->advance(std::chrono::milliseconds(1));
            }

            check_aggregates(store);
        }
    );
}
