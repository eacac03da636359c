#include <catch2/catch_test_macros.hpp>
#include <uplist/uplist.hpp>

#include <iostream>
#include <memory_resource>
#include <string>
#include <type_traits>

using namespace uplist;

struct CountingAllocator {
    static constexpr auto kBlockSize = kDefaultBlockSize;

    std::size_t alloc_count = 0;
    std::size_t dealloc_count = 0;

    std::size_t bytes_allocated = 0;
    std::size_t bytes_live = 0;

    void* allocate(std::size_t sz, std::size_t align) {
        ++alloc_count;
        bytes_allocated += sz;
        bytes_live += sz;

        void* p = nullptr;

#if defined(_MSC_VER)
        p = _aligned_malloc(sz, align);
#else
        if (posix_memalign(&p, align, sz) != 0)
            return nullptr;
#endif
        return p;
    }

    void deallocate(void* p, const std::size_t sz, std::size_t) {
        ++dealloc_count;
        bytes_live -= sz;

#if defined(_MSC_VER)
        _aligned_free(p);
#else
        std::free(p);
#endif
    }

    ~CountingAllocator() {
        if (bytes_live != 0) {
            std::cout << "\n==== Allocator statistics ====\n";
            std::cout << "alloc calls     : " << alloc_count << "\n";
            std::cout << "dealloc calls   : " << dealloc_count << "\n";
            std::cout << "bytes live      : " << bytes_live << "\n";
            std::cout << "MEMORY LEAK DETECTED: " << bytes_live << " bytes\n";
            std::cout << "==============================\n";
        }
    }
};

struct CountingArena {
    CountingAllocator alloc;
    Arena arena;
    CountingArena(): alloc {}, arena {alloc} { }
};

static void build_sample(NodeRef root) {
    root.set_dictionary();
    root.add("name", "widget");
    root.add("count", std::int64_t {3});
    auto list = root.add_array("list");
    list.add(1);
    list.add(2);
    list.add(3);
}

TEST_CASE("allocator actually allocates memory", "[uplist][alloc]") {
    CountingArena a;
    TreeBuilder b {a.arena};
    build_sample(b.root());

    REQUIRE(b.ok());
    REQUIRE(a.alloc.alloc_count > 0);
    REQUIRE(a.alloc.bytes_allocated > 0);
}

TEST_CASE("allocator balanced allocations", "[uplist][alloc]") {
    CountingArena a;

    {
        TreeBuilder b {a.arena};
        build_sample(b.root());
        REQUIRE(b.ok());
    }

    a.arena.reset();

    REQUIRE(a.alloc.alloc_count == a.alloc.dealloc_count);
    REQUIRE(a.alloc.bytes_live == 0);
}

TEST_CASE("allocator stress memory growth", "[uplist][alloc]") {
    CountingArena a;

    for (auto i = 0; i < 100; ++i) {
        TreeBuilder b {a.arena};
        auto root = b.root().set_array();
        for (auto j = 0; j < 500; ++j)
            root.add(std::string {"entry "} + std::to_string(j));
        REQUIRE(b.ok());
        REQUIRE(b.view().size() == 500);
        a.arena.reset();
    }

    REQUIRE(a.alloc.bytes_live == 0);
}

TEST_CASE("allocator: PmrAllocator basic", "[uplist][alloc]") {
    std::pmr::monotonic_buffer_resource pool;
    PmrAllocator<> alloc {&pool};

    TreeBuilder b {alloc};
    build_sample(b.root());

    REQUIRE(b.ok());
    REQUIRE(b.view().get("name").as_string() == "widget");
}

TEST_CASE("allocator: alignment respected", "[uplist][alloc]") {
    NewAllocator<> alloc;
    Arena arena {alloc};

    for (const std::size_t al : {1u, 8u, 16u, 64u}) {
        void* p = arena.alloc(24, al);
        REQUIRE(p != nullptr);
        REQUIRE(reinterpret_cast<std::uintptr_t>(p) % al == 0);
    }

    REQUIRE(arena.alloc(8, 3) == nullptr);
}

TEST_CASE("builder scalars and kinds", "[uplist][builder]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();

    root.add("s", "text");
    root.add("i", std::int64_t {-5});
    root.add("u", std::uint64_t {5});
    root.add("r", 1.5);
    root.add("f", 2.5f);
    root.add("b", true);
    root.add("d", Bytes {1, 2, 3});
    root.add("t", Date {std::chrono::seconds {86400}});
    root.add("uid", Uid {7});

    REQUIRE(b.ok());

    const ValueRef v = b.view();
    REQUIRE(v.is_dictionary());
    REQUIRE(v.size() == 9);

    CHECK(v["s"].is_string());
    CHECK(v["i"].is_number());
    CHECK(v["i"].is_signed());
    CHECK(v["i"].try_i64() == -5);
    CHECK_FALSE(v["u"].is_signed());
    CHECK(v["u"].try_u64() == 5u);
    CHECK(v["r"].is_wide());
    CHECK_FALSE(v["f"].is_wide());
    CHECK(v["f"].try_double() == 2.5);
    CHECK(v["b"].try_bool() == true);
    CHECK(v["d"].try_data()->size() == 3);
    CHECK(v["t"].try_date() == Date {std::chrono::seconds {86400}});
    CHECK(v["uid"].try_uid() == Uid {7});

    CHECK(type_name(v["uid"].type()) == "UID");
    CHECK(type_name(v.type()) == "dictionary");
}

TEST_CASE("builder duplicate keys allowed", "[uplist][builder]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();

    root.add("key", 1);
    root.add("key", 42);

    REQUIRE(root.size() == 2);
    REQUIRE(b.view().get("key").try_i64() == 42);
}

TEST_CASE("builder nested manual build", "[uplist][builder]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();

    auto users = root.add_array("users");
    for (int i = 0; i < 3; ++i) {
        auto user = users.add_dictionary();
        user.add("id", i);
        user.add("name", "user" + std::to_string(i));
        auto roles = user.add_array("roles");
        roles.add("read");
        if (i == 0)
            roles.add("admin");
    }

    REQUIRE(b.ok());

    const ValueRef v = b.view();
    REQUIRE(v["users"].size() == 3);
    REQUIRE(v["users"][0]["roles"].size() == 2);
    REQUIRE(v["users"][2]["name"].as_string() == "user2");
    REQUIRE(v["users"][2]["roles"][0].as_string() == "read");
}

TEST_CASE("builder large array grows in place", "[uplist][builder]") {
    TreeBuilder b;
    auto root = b.root().set_array(1);

    auto first = root.add("first");
    for (int i = 0; i < 5000; ++i)
        root.add(i);

    REQUIRE(b.ok());
    REQUIRE(root.size() == 5001);
    REQUIRE(first.view().as_string() == "first");
    REQUIRE(b.view()[5000].try_i64() == 4999);
}

TEST_CASE("builder assignment keeps dictionary key", "[uplist][builder]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();

    auto slot = root.add("k", 1);
    slot = "replaced";

    REQUIRE(b.view().get("k").as_string() == "replaced");

    slot.set_array();
    slot.add(true);
    REQUIRE(b.view().get("k").is_array());
    REQUIRE(b.view().get("k")[0].try_bool() == true);
}

TEST_CASE("builder refuses an absent node as a dictionary entry", "[uplist][builder]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();

    auto slot = root.add("x", 1);
    slot = Value {};

    CHECK(b.error() == ErrorCode::BuilderInvalidState);
    REQUIRE(b.view().size() == 1);
    CHECK(b.view().get("x").try_i64() == 1);

    const Value v = to_value(b.view());
    const auto& d = v.as<ValueDictionary>();
    REQUIRE(d.size() == 1);
    CHECK(d.count("") == 0);
}

TEST_CASE("builder absent node inside an array stays a gap", "[uplist][builder]") {
    TreeBuilder b;
    auto root = b.root().set_array();

    auto slot = root.add(1);
    root.add(2);
    slot = Value {};

    REQUIRE(b.ok());
    REQUIRE(b.view().size() == 2);
    CHECK(b.view()[0].is_null());
    CHECK(b.view()[1].try_i64() == 2);
}

TEST_CASE("builder and arena stay where they are built", "[uplist][builder]") {
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<TreeBuilder>);
    STATIC_REQUIRE_FALSE(std::is_move_assignable_v<TreeBuilder>);
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<Arena>);
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<ArenaHolder>);
}

TEST_CASE("String copy policy isolates lifetime", "[uplist][builder][string][copy]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();

    {
        std::string temp = "hello";
        root.add("k", temp);
        temp[0] = 'j';
    }

    REQUIRE(b.view().get("k").as_string() == "hello");
}

TEST_CASE("String view policy shares lifetime", "[uplist][builder][string][view]") {
    TreeBuilder::Options opt;
    opt.strings = StringPolicy::View;

    std::string s = "hello";
    TreeBuilder b {opt};
    auto root = b.root().set_dictionary();
    root.add("k", std::string_view {s});

    s[0] = 'j';
    REQUIRE(b.view().get("k").as_string() == "jello");
}

TEST_CASE("value ref lookups", "[uplist][view]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();
    root.add("a", 1);
    root.add("b", 2);
    root.add("a", 3);

    const ValueRef v = b.view();

    CHECK(v.contains("a"));
    CHECK_FALSE(v.contains("zzz"));
    CHECK(v.get("zzz").is_null());
    CHECK(v.get("a").try_i64() == 3);
    CHECK(v[7].is_null());

    std::string order;
    for (const auto [key, value] : v.members())
        order += key;
    CHECK(order == "aba");

    int seen = 0;
    v.for_each([&](ValueRef) {
        ++seen;
        return seen < 2;
    });
    CHECK(seen == 2);
}

TEST_CASE("materializer covers every kind", "[uplist][value]") {
    TreeBuilder b;
    auto root = b.root().set_dictionary();
    root.add("s", "text");
    root.add("i", std::int64_t {-1});
    root.add("u", std::uint64_t {18446744073709551615ull});
    root.add("r", 0.25);
    root.add("f", 0.5f);
    root.add("b", false);
    root.add("d", Bytes {0xde, 0xad});
    root.add("t", Date {std::chrono::nanoseconds {1234567890}});
    root.add("uid", Uid {9});
    auto arr = root.add_array("arr");
    arr.add(1);
    arr.add("two");

    const Value v = to_value(b.view());
    REQUIRE(v.is<ValueDictionary>());

    const auto& d = v.as<ValueDictionary>();
    CHECK(d.at("s").as<std::string>() == "text");
    CHECK(d.at("i").as<std::int64_t>() == -1);
    CHECK(d.at("u").as<std::uint64_t>() == 18446744073709551615ull);
    CHECK(d.at("r").as<double>() == 0.25);
    CHECK(d.at("f").as<float>() == 0.5f);
    CHECK(d.at("b").as<bool>() == false);
    CHECK(d.at("d").as<Bytes>() == Bytes {0xde, 0xad});
    CHECK(d.at("t").as<Date>() == Date {std::chrono::nanoseconds {1234567890}});
    CHECK(d.at("uid").as<Uid>() == Uid {9});

    const auto& a = d.at("arr").as<ValueArray>();
    REQUIRE(a.size() == 2);
    CHECK(a[0].as<std::int64_t>() == 1);
    CHECK(a[1].as<std::string>() == "two");
}

TEST_CASE("materializer: absent node and duplicate keys", "[uplist][value]") {
    CHECK(to_value(ValueRef {}).is_null());

    TreeBuilder b;
    auto root = b.root().set_dictionary();
    root.add("k", "first");
    root.add("k", "second");

    const Value v = to_value(b.view());
    const auto& d = v.as<ValueDictionary>();
    REQUIRE(d.size() == 1);
    CHECK(d.at("k").as<std::string>() == "second");
}

TEST_CASE("materializer round trips through the builder", "[uplist][value]") {
    const Value original {ValueDictionary {
        {"name", Value {std::string {"widget"}}},
        {"sizes", Value {ValueArray {Value {std::int64_t {1}}, Value {std::uint64_t {2}}, Value {1.5f}}}},
        {"meta", Value {ValueDictionary {{"ok", Value {true}}, {"blob", Value {Bytes {1, 2, 3}}}}}},
    }};

    TreeBuilder first;
    first.root() = original;
    REQUIRE(first.ok());

    const Value once = to_value(first.view());
    CHECK(once == original);

    TreeBuilder second;
    second.root() = once;
    REQUIRE(second.ok());

    CHECK(to_value(second.view()) == once);
}
