#include <cstring>
#include "unit_tests.h"

namespace Birch {

// Integer key stored in descending order.
struct Descending {
    std::uint32_t value {};
};

template<>
struct Codec<Descending> {
    static auto type_name() -> std::string
    {
        return "descending_u32";
    }

    static auto fixed_width() -> std::optional<Size>
    {
        return sizeof(std::uint32_t);
    }

    static auto encode(const Descending &key) -> std::string
    {
        return Codec<std::uint32_t>::encode(key.value);
    }

    [[nodiscard]]
    static auto decode(const Slice &in, Descending &out) -> Status
    {
        return Codec<std::uint32_t>::decode(in, out.value);
    }

    static auto compare(const Slice &lhs, const Slice &rhs) -> ThreeWayComparison
    {
        return Codec<std::uint32_t>::compare(rhs, lhs);
    }
};

template<class T>
static auto decode(const AccessGuard<T> &guard) -> T
{
    T out {};
    EXPECT_OK(guard.value(out));
    return out;
}

// Works on either kind of table.
template<class K, class V>
static auto sum_values(const ReadableTable<K, V> &table) -> V
{
    V total {};
    auto iter = table.iter();
    while (auto entry = iter.next())
        total += decode(entry->second);
    EXPECT_OK(iter.status());
    return total;
}

class TableTests: public testing::Test {
public:
    TableTests()
        : store {SMALL_PAGE_SIZE}
    {}

    auto SetUp() -> void override
    {
        Options options;
        options.page_size = SMALL_PAGE_SIZE;
        options.store = &store;
        ASSERT_OK(Database::open(options, db));
        ASSERT_OK(db->begin_write(txn));
    }

    auto TearDown() -> void override
    {
        txn.reset();
        db.reset();
    }

    template<class K, class V>
    auto open(const std::string &name) -> std::unique_ptr<Table<K, V>>
    {
        std::unique_ptr<Table<K, V>> table;
        EXPECT_OK(txn->open_table(TableDefinition<K, V> {name}, table));
        return table;
    }

    MemoryStore store;
    std::unique_ptr<Database> db;
    std::unique_ptr<WriteTransaction> txn;
};

TEST_F(TableTests, InsertGetRemove)
{
    auto table = open<std::uint64_t, std::string>("t");
    ASSERT_EQ(table->name(), "t");
    ASSERT_OK(table->insert(1, "one"));
    ASSERT_OK(table->insert(2, "two"));

    std::optional<AccessGuard<std::string>> out;
    ASSERT_OK(table->get(1, out));
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(decode(*out), "one");
    ASSERT_OK(table->get(3, out));
    ASSERT_FALSE(out.has_value());

    ASSERT_OK(table->remove(1, out));
    ASSERT_EQ(decode(*out), "one");
    ASSERT_OK(table->remove(1, out));
    ASSERT_FALSE(out.has_value());

    Size n {};
    ASSERT_OK(table->len(n));
    ASSERT_EQ(n, 1);
}

TEST_F(TableTests, InsertReportsReplacedValue)
{
    auto table = open<std::string, std::uint32_t>("t");
    std::optional<AccessGuard<std::uint32_t>> old;
    ASSERT_OK(table->insert("k", 1, old));
    ASSERT_FALSE(old.has_value());
    ASSERT_OK(table->insert("k", 2, old));
    ASSERT_TRUE(old.has_value());
    ASSERT_EQ(decode(*old), 1);
}

TEST_F(TableTests, EmptyTable)
{
    auto table = open<std::uint32_t, std::uint32_t>("t");
    bool is_empty {};
    ASSERT_OK(table->is_empty(is_empty));
    ASSERT_TRUE(is_empty);
    ASSERT_FALSE(table->iter().next().has_value());

    std::optional<Table<std::uint32_t, std::uint32_t>::Entry> entry;
    ASSERT_OK(table->pop_first(entry));
    ASSERT_FALSE(entry.has_value());
    ASSERT_OK(table->pop_last(entry));
    ASSERT_FALSE(entry.has_value());

    ASSERT_OK(table->insert(1, 1));
    ASSERT_OK(table->is_empty(is_empty));
    ASSERT_FALSE(is_empty);
}

TEST_F(TableTests, IntegerKeysAreOrderedNumerically)
{
    auto table = open<std::uint32_t, std::uint32_t>("t");
    for (std::uint32_t i {}; i < 300; ++i)
        ASSERT_OK(table->insert(i * 7 % 300, i));

    auto iter = table->iter();
    std::uint32_t expected {};
    while (auto entry = iter.next()) {
        ASSERT_EQ(decode(entry->first), expected);
        expected++;
    }
    ASSERT_OK(iter.status());
    ASSERT_EQ(expected, 300);
}

TEST_F(TableTests, TypedRanges)
{
    auto table = open<std::int64_t, std::int64_t>("t");
    for (std::int64_t i {-50}; i < 50; ++i)
        ASSERT_OK(table->insert(i, i * i));

    const auto keys = [](RangeIter<std::int64_t, std::int64_t> iter, bool reverse = false) {
        std::vector<std::int64_t> out;
        while (auto entry = reverse ? iter.next_back() : iter.next())
            out.emplace_back(decode(entry->first));
        return out;
    };
    using Range = KeyRange<std::int64_t>;
    ASSERT_EQ(keys(table->range(Range::closed(-2, 2))), (std::vector<std::int64_t> {-2, -1, 0, 1, 2}));
    ASSERT_EQ(keys(table->range(Range::half_open(-2, 2))), (std::vector<std::int64_t> {-2, -1, 0, 1}));
    ASSERT_EQ(keys(table->range(Range::greater_than(46))), (std::vector<std::int64_t> {47, 48, 49}));
    ASSERT_EQ(keys(table->range(Range::at_least(47))), (std::vector<std::int64_t> {47, 48, 49}));
    ASSERT_EQ(keys(table->range(Range::less_than(-48))), (std::vector<std::int64_t> {-50, -49}));
    ASSERT_EQ(keys(table->range(Range::at_most(-48)), true), (std::vector<std::int64_t> {-48, -49, -50}));
    ASSERT_TRUE(keys(table->range(Range::closed(5, -5))).empty());
}

TEST_F(TableTests, CustomKeyOrder)
{
    auto table = open<Descending, std::string>("t");
    for (std::uint32_t i {}; i < 10; ++i)
        ASSERT_OK(table->insert(Descending {i}, std::to_string(i)));

    // Under a descending order, the lower bound is the larger number.
    auto iter = table->range(KeyRange<Descending>::closed(Descending {7}, Descending {3}));
    std::vector<std::uint32_t> keys;
    while (auto entry = iter.next())
        keys.emplace_back(decode(entry->first).value);
    ASSERT_EQ(keys, (std::vector<std::uint32_t> {7, 6, 5, 4, 3}));

    std::optional<Table<Descending, std::string>::Entry> first;
    ASSERT_OK(table->pop_first(first));
    ASSERT_EQ(decode(first->first).value, 9);
}

TEST_F(TableTests, PopFirstAndLast)
{
    auto table = open<std::uint32_t, std::string>("t");
    ASSERT_OK(table->insert(1, "a"));
    ASSERT_OK(table->insert(2, "b"));
    ASSERT_OK(table->insert(3, "c"));

    std::optional<Table<std::uint32_t, std::string>::Entry> entry;
    ASSERT_OK(table->pop_first(entry));
    ASSERT_EQ(decode(entry->first), 1);
    ASSERT_EQ(decode(entry->second), "a");
    ASSERT_OK(table->pop_last(entry));
    ASSERT_EQ(decode(entry->first), 3);
    ASSERT_EQ(decode(entry->second), "c");

    Size n {};
    ASSERT_OK(table->len(n));
    ASSERT_EQ(n, 1);
    std::optional<AccessGuard<std::string>> value;
    ASSERT_OK(table->get(2, value));
    ASSERT_EQ(decode(*value), "b");
}

TEST_F(TableTests, PartialDrainKeepsTheRest)
{
    auto table = open<std::uint32_t, std::uint32_t>("t");
    for (std::uint32_t i {}; i < 10; ++i)
        ASSERT_OK(table->insert(i, i + 100));

    {
        auto drain = table->drain(KeyRange<std::uint32_t>::at_least(2));
        for (std::uint32_t i {2}; i < 5; ++i) {
            auto entry = drain.next();
            ASSERT_TRUE(entry.has_value());
            ASSERT_EQ(decode(entry->first), i);
            ASSERT_EQ(decode(entry->second), i + 100);
        }
        ASSERT_OK(drain.status());
    }

    Size n {};
    ASSERT_OK(table->len(n));
    ASSERT_EQ(n, 7);
    std::optional<AccessGuard<std::uint32_t>> out;
    ASSERT_OK(table->get(2, out));
    ASSERT_FALSE(out.has_value());
    ASSERT_OK(table->get(5, out));
    ASSERT_TRUE(out.has_value());
}

TEST_F(TableTests, DrainFromTheBack)
{
    auto table = open<std::uint32_t, std::uint32_t>("t");
    for (std::uint32_t i {}; i < 100; ++i)
        ASSERT_OK(table->insert(i, i));

    auto drain = table->drain(KeyRange<std::uint32_t>::half_open(10, 90));
    std::uint32_t expected {89};
    while (auto entry = drain.next_back())
        ASSERT_EQ(decode(entry->first), expected--);
    ASSERT_OK(drain.status());
    ASSERT_EQ(expected, 9);

    Size n {};
    ASSERT_OK(table->len(n));
    ASSERT_EQ(n, 20);
}

TEST_F(TableTests, ReservedValue)
{
    auto table = open<std::string, std::string>("t");
    AccessGuardMut guard;
    ASSERT_OK(table->insert_reserve("key", 5, guard));
    std::memcpy(guard.data().data(), "hello", 5);

    std::optional<AccessGuard<std::string>> out;
    ASSERT_OK(table->get("key", out));
    ASSERT_EQ(decode(*out), "hello");
}

TEST_F(TableTests, ReservedValueFilledBeforeCloseIsCommitted)
{
    {
        auto table = open<std::string, std::string>("t");
        for (std::uint32_t i {}; i < 50; ++i)
            ASSERT_OK(table->insert(make_key(i), make_value(i)));
        AccessGuardMut guard;
        ASSERT_OK(table->insert_reserve("reserved", 5, guard));
        std::memcpy(guard.data().data(), "hello", 5);
    }
    ASSERT_OK(txn->commit());

    std::unique_ptr<ReadTransaction> reader;
    ASSERT_OK(db->begin_read(reader));
    std::unique_ptr<ReadOnlyTable<std::string, std::string>> table;
    ASSERT_OK(reader->open_table(TableDefinition<std::string, std::string> {"t"}, table));
    std::optional<AccessGuard<std::string>> out;
    ASSERT_OK(table->get("reserved", out));
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(decode(*out), "hello");

    Size n {};
    ASSERT_OK(table->len(n));
    ASSERT_EQ(n, 51);
}

TEST_F(TableTests, GenericReadableTable)
{
    {
        auto table = open<std::uint32_t, std::uint64_t>("t");
        for (std::uint32_t i {1}; i <= 100; ++i)
            ASSERT_OK(table->insert(i, i));
        ASSERT_EQ(sum_values(*table), 5050);
    }
    ASSERT_OK(txn->commit());

    std::unique_ptr<ReadTransaction> reader;
    ASSERT_OK(db->begin_read(reader));
    std::unique_ptr<ReadOnlyTable<std::uint32_t, std::uint64_t>> table;
    ASSERT_OK(reader->open_table(TableDefinition<std::uint32_t, std::uint64_t> {"t"}, table));
    ASSERT_EQ(sum_values(*table), 5050);
}

TEST_F(TableTests, DebugOutput)
{
    auto table = open<std::string, std::string>("t");
    ASSERT_OK(table->insert("a", "1"));
    std::string out;
    ASSERT_OK(table->print_debug(true, out));
    ASSERT_NE(out.find("a:1"), std::string::npos);
}

TEST_F(TableTests, ChangesSurviveReopening)
{
    {
        auto table = open<std::string, std::string>("t");
        ASSERT_OK(table->insert("a", "1"));
    }
    {
        auto table = open<std::string, std::string>("t");
        ASSERT_OK(table->insert("b", "2"));
        Size n {};
        ASSERT_OK(table->len(n));
        ASSERT_EQ(n, 2);
    }
    ASSERT_OK(txn->commit());

    ASSERT_OK(db->begin_write(txn));
    auto table = open<std::string, std::string>("t");
    Size n {};
    ASSERT_OK(table->len(n));
    ASSERT_EQ(n, 2);
}

} // namespace Birch
