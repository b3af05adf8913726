#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include "Lanescan/Container/PerfectScanMap.hpp"
#include "../TestKeys.hpp"

using namespace Lanescan;
using namespace Lanescan::Test;

class PerfectScanMapTest : public ::testing::Test
{
protected:
    using Map = PerfectScanMap<DummyVal, 16>;

    void SetUp() override {}
    void TearDown() override {}

    static Entries Numbered(std::size_t count)
    {
        Entries entries;
        for (std::size_t i = 0; i < count; ++i)
        {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "k%02zu", i);
            entries.emplace_back(buffer, DummyVal{i});
        }
        return entries;
    }
};

TEST_F(PerfectScanMapTest, PrefixKeys)
{
    auto result = Map::TryBuild(PrefixKeys());
    ASSERT_TRUE(result.IsOk());
    const Map& map = result.Value();

    ASSERT_NE(map.Get("key1"), nullptr);
    ASSERT_NE(map.Get("key1longer"), nullptr);
    ASSERT_NE(map.Get("key"), nullptr);
    ASSERT_NE(map.Get("now4"), nullptr);
    EXPECT_EQ(map.Get("key1")->value, 1001u);
    EXPECT_EQ(map.Get("key1longer")->value, 1002u);
    EXPECT_EQ(map.Get("key")->value, 1003u);
    EXPECT_EQ(map.Get("now4")->value, 1004u);

    EXPECT_EQ(map.Get("key1 continued"), nullptr);
    EXPECT_EQ(map.Get("ke"), nullptr);
    EXPECT_EQ(map.Get(""), nullptr);
    EXPECT_EQ(map.Get("now"), nullptr);
}

TEST_F(PerfectScanMapTest, FullCompareRejectsScanCandidate)
{
    auto result = Map::TryBuild(PrefixKeys());
    ASSERT_TRUE(result.IsOk());
    const Map& map = result.Value();

    // Agrees with "key1" at every scanned offset, differs at offset 1
    EXPECT_EQ(map.Layout().FindCandidate("kon1"), 0u);
    EXPECT_EQ(map.Get("kon1"), nullptr);
    EXPECT_FALSE(map.Contains("kon1"));
}

TEST_F(PerfectScanMapTest, PositionBudgetBoundary)
{
    auto tooSmall = PerfectScanMap<DummyVal, 2>::TryBuild(ThreePositionKeys());
    ASSERT_TRUE(tooSmall.IsErr());
    EXPECT_EQ(tooSmall.Error().error.code, ErrorCode::Unsolvable);
    EXPECT_STREQ(tooSmall.Error().error.message, "Unable to 'solve' with a sufficiently small number of scans");
    EXPECT_EQ(tooSmall.Error().entries, ThreePositionKeys());

    auto enough = PerfectScanMap<DummyVal, 3>::TryBuild(ThreePositionKeys());
    ASSERT_TRUE(enough.IsOk());
    const auto positions = enough->Positions();
    EXPECT_EQ(std::vector<std::size_t>(positions.begin(), positions.end()), (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_EQ(enough->PositionCount(), 3u);
    EXPECT_EQ(enough->GroupCount(), 1u);
    EXPECT_EQ(enough->PlaneCount(), 3u);

    for (const auto& [key, value] : ThreePositionKeys())
    {
        ASSERT_NE(enough->Get(key), nullptr) << key;
        EXPECT_EQ(*enough->Get(key), value);
    }
}

TEST_F(PerfectScanMapTest, EmptyInput)
{
    auto result = Map::TryBuild({});
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().error.code, ErrorCode::EmptyInput);
    EXPECT_STREQ(result.Error().error.message, "Empty map not supported");
    EXPECT_TRUE(result.Error().entries.empty());
}

TEST_F(PerfectScanMapTest, CapacityExceeded)
{
    using Tiny = PerfectScanMap<DummyVal, 1>;
    static_assert(Tiny::CAPACITY == 16);

    auto result = Tiny::TryBuild(Numbered(17));
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().error.code, ErrorCode::CapacityExceeded);
    EXPECT_STREQ(result.Error().error.message, "Too many keys to perform even a single scan");
    EXPECT_EQ(result.Error().entries, Numbered(17));
}

TEST_F(PerfectScanMapTest, ExactlyFillsPlaneBudget)
{
    // 16 keys in one group, two offsets: both planes used
    auto result = PerfectScanMap<DummyVal, 2>::TryBuild(Numbered(16));
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    EXPECT_EQ(map.GroupCount(), 1u);
    EXPECT_EQ(map.PositionCount(), 2u);
    EXPECT_EQ(map.PlaneCount(), 2u);
    EXPECT_EQ(map.Positions()[0], 2u);
    EXPECT_EQ(map.Positions()[1], 1u);

    for (std::size_t i = 0; i < 16; ++i)
    {
        const auto& key = map.Entries()[i].first;
        ASSERT_NE(map.Get(key), nullptr) << key;
        EXPECT_EQ(map.Get(key)->value, i);
    }
    EXPECT_EQ(map.Get("k16"), nullptr);
}

TEST_F(PerfectScanMapTest, PlaneBudgetIsSharedByGroups)
{
    using Map = PerfectScanMap<DummyVal, 4>;
    static_assert(Map::MAX_PLANES == 4);
    static_assert(Map::CAPACITY == Map::MAX_PLANES * Map::LANE_WIDTH);
    static_assert(std::is_same_v<Map::KeyType, std::string>);
    static_assert(std::is_same_v<Map::MappedType, DummyVal>);
    static_assert(std::is_same_v<Map::iterator, Map::const_iterator>);

    // 20 keys span two groups, so four planes leave room for two offsets
    auto result = Map::TryBuild(Numbered(20));
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result->GroupCount(), 2u);
    EXPECT_EQ(result->PositionCount(), 2u);
    EXPECT_EQ(result->PlaneCount(), Map::MAX_PLANES);
    EXPECT_EQ(result->Get("k19")->value, 19u);

    // Three planes over two groups leave a single offset, which cannot split them
    auto tooFew = PerfectScanMap<DummyVal, 3>::TryBuild(Numbered(20));
    ASSERT_TRUE(tooFew.IsErr());
    EXPECT_EQ(tooFew.Error().error.code, ErrorCode::Unsolvable);
}

TEST_F(PerfectScanMapTest, InvalidSearchDepth)
{
    BuildOptions options;
    options.searchDepth = 0;

    auto result = Map::TryBuild(PrefixKeys(), options);
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().error.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(result.Error().entries, PrefixKeys());
}

TEST_F(PerfectScanMapTest, ShallowSearchDepth)
{
    const Entries entries = {{"prefix_common_A", {1}}, {"prefix_common_B", {2}}};

    BuildOptions shallow;
    shallow.searchDepth = 8;
    auto failed = Map::TryBuild(entries, shallow);
    ASSERT_TRUE(failed.IsErr());
    EXPECT_EQ(failed.Error().error.code, ErrorCode::Unsolvable);

    auto built = Map::TryBuild(entries);
    ASSERT_TRUE(built.IsOk());
    EXPECT_EQ(built->Positions()[0], 14u);
    EXPECT_EQ(built->Get("prefix_common_B")->value, 2u);
}

TEST_F(PerfectScanMapTest, DuplicateKeysFail)
{
    const Entries entries = {{"dup", {1}}, {"other", {2}}, {"dup", {3}}};

    auto result = Map::TryBuild(entries);
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().error.code, ErrorCode::Unsolvable);
    EXPECT_EQ(result.Error().entries, entries);
}

TEST_F(PerfectScanMapTest, SingleKey)
{
    auto result = Map::TryBuild({{"only", {7}}});
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    EXPECT_EQ(map.Size(), 1u);
    EXPECT_EQ(map.PositionCount(), 1u);
    EXPECT_EQ(map.Get("only")->value, 7u);
    EXPECT_EQ(map.Get("onlx"), nullptr);
    EXPECT_EQ(map.Get("o"), nullptr);
    EXPECT_EQ(map.Get(""), nullptr);
}

TEST_F(PerfectScanMapTest, EmptyStringKey)
{
    auto result = Map::TryBuild({{"", {1}}, {"a", {2}}});
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    EXPECT_EQ(map.Get("")->value, 1u);
    EXPECT_EQ(map.Get("a")->value, 2u);
    EXPECT_EQ(map.Get(std::string_view("\0", 1)), nullptr);
    EXPECT_EQ(map.Get("b"), nullptr);
}

TEST_F(PerfectScanMapTest, EmbeddedNulBytes)
{
    const std::string first("a\0b", 3);
    const std::string second("a\0c", 3);
    auto result = Map::TryBuild({{first, {1}}, {second, {2}}, {"a", {3}}});
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    EXPECT_EQ(map.Positions()[0], 2u);
    EXPECT_EQ(map.Get(first)->value, 1u);
    EXPECT_EQ(map.Get(second)->value, 2u);
    EXPECT_EQ(map.Get("a")->value, 3u);
    EXPECT_EQ(map.Get(std::string_view("a\0", 2)), nullptr);
    EXPECT_EQ(map.Get(std::string_view("a\0d", 3)), nullptr);
}

TEST_F(PerfectScanMapTest, PrefixesAndExtensionsMiss)
{
    auto result = Map::TryBuild(FieldEntries());
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    for (std::string_view name : FieldNames())
    {
        for (std::size_t length = 0; length < name.size(); ++length)
        {
            const std::string_view prefix = name.substr(0, length);
            if (std::find(FieldNames().begin(), FieldNames().end(), prefix) == FieldNames().end())
            {
                EXPECT_EQ(map.Get(prefix), nullptr) << prefix;
            }
        }

        EXPECT_EQ(map.Get(std::string(name) + "_x"), nullptr) << name;
        EXPECT_EQ(map.Get(std::string(name) + '\0'), nullptr) << name;
    }
}

TEST_F(PerfectScanMapTest, UnscannedByteChangesAreRejected)
{
    auto result = Map::TryBuild(FieldEntries());
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();
    const auto positions = map.Positions();

    for (std::size_t index = 0; index < map.Size(); ++index)
    {
        const std::string& key = map.Entries()[index].first;
        for (std::size_t offset = 0; offset < key.size(); ++offset)
        {
            if (std::find(positions.begin(), positions.end(), offset) != positions.end())
            {
                continue;
            }

            std::string mutated = key;
            mutated[offset] = static_cast<char>(mutated[offset] ^ 0x20);

            // The scan still lands on the original slot; only the full compare catches it
            EXPECT_EQ(map.Layout().FindCandidate(mutated), index) << mutated;
            EXPECT_EQ(map.Get(mutated), nullptr) << mutated;
        }
    }
}

TEST_F(PerfectScanMapTest, RebuildIsIdentical)
{
    auto first = Map::TryBuild(FieldEntries());
    auto second = Map::TryBuild(FieldEntries());
    ASSERT_TRUE(first.IsOk());
    ASSERT_TRUE(second.IsOk());

    const auto a = first->Positions();
    const auto b = second->Positions();
    EXPECT_TRUE(std::equal(a.begin(), a.end(), b.begin(), b.end()));
    EXPECT_EQ(first->GroupCount(), second->GroupCount());
}

TEST_F(PerfectScanMapTest, IterationKeepsConstructionOrder)
{
    const Entries entries = PrefixKeys();
    auto result = Map::TryBuild(entries);
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    EXPECT_FALSE(map.Empty());
    ASSERT_EQ(map.Size(), entries.size());

    std::size_t index = 0;
    for (const auto& entry : map)
    {
        EXPECT_EQ(entry, entries[index]);
        ++index;
    }
    EXPECT_EQ(index, entries.size());
    EXPECT_EQ(std::distance(map.cbegin(), map.cend()), static_cast<std::ptrdiff_t>(entries.size()));
}

TEST_F(PerfectScanMapTest, FindReturnsEntryOrEnd)
{
    auto result = Map::TryBuild(FieldEntries());
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    auto it = map.Find("city");
    ASSERT_NE(it, map.end());
    EXPECT_EQ(it->first, "city");
    EXPECT_EQ(it->second.value, 13u);

    EXPECT_EQ(map.Find("town"), map.end());
    EXPECT_TRUE(map.Contains("timeout_ms"));
    EXPECT_FALSE(map.Contains("timeout"));
}

TEST_F(PerfectScanMapTest, CopiedMapAnswersTheSame)
{
    auto result = Map::TryBuild(FieldEntries());
    ASSERT_TRUE(result.IsOk());

    const Map copy = result.Value();
    for (std::string_view name : FieldNames())
    {
        ASSERT_NE(copy.Get(name), nullptr) << name;
        EXPECT_EQ(copy.Get(name), &copy.Find(name)->second);
        EXPECT_EQ(copy.Get(name)->value, result->Get(name)->value);
    }
}

template<typename Config>
class PerfectScanMapConfigTest : public ::testing::Test
{
};

template<typename Width, typename Strategy>
struct MapConfig
{
    using Map = PerfectScanMap<DummyVal, 16, Width, Strategy>;
};

using MapConfigs = ::testing::Types<
    MapConfig<Simd::Width128, BitmaskScan>,
    MapConfig<Simd::Width128, DescendingMaxScan>,
    MapConfig<Simd::Width256, BitmaskScan>,
    MapConfig<Simd::Width256, DescendingMaxScan>,
    MapConfig<Simd::Width512, BitmaskScan>,
    MapConfig<Simd::Width512, DescendingMaxScan>>;
TYPED_TEST_SUITE(PerfectScanMapConfigTest, MapConfigs);

TYPED_TEST(PerfectScanMapConfigTest, FieldNamesRoundTrip)
{
    using Map = typename TypeParam::Map;

    auto result = Map::TryBuild(FieldEntries());
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    EXPECT_EQ(map.GroupCount(), (FieldNames().size() + Map::LANE_WIDTH - 1) / Map::LANE_WIDTH);
    EXPECT_LE(map.PlaneCount(), Map::MAX_PLANES);

    std::size_t expected = 0;
    for (std::string_view name : FieldNames())
    {
        const DummyVal* value = map.Get(name);
        ASSERT_NE(value, nullptr) << name;
        EXPECT_EQ(value->value, expected++);
    }

    EXPECT_EQ(map.Get("missing_field"), nullptr);
    EXPECT_EQ(map.Get("ID"), nullptr);
    EXPECT_EQ(map.Get(""), nullptr);
}

TYPED_TEST(PerfectScanMapConfigTest, SlotZeroOfEveryGroup)
{
    using Map = typename TypeParam::Map;

    Entries entries;
    for (std::size_t i = 0; i < 100; ++i)
    {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "k%02zu", i);
        entries.emplace_back(buffer, DummyVal{i});
    }

    auto result = Map::TryBuild(entries);
    ASSERT_TRUE(result.IsOk());
    const auto& map = result.Value();

    for (std::size_t first = 0; first < entries.size(); first += Map::LANE_WIDTH)
    {
        ASSERT_NE(map.Get(entries[first].first), nullptr) << entries[first].first;
        EXPECT_EQ(map.Get(entries[first].first)->value, first);
    }
}
