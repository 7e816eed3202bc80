#include <monadic-core/assert-handler.hh>
#include <monadic-core/result.hh>

#include <nexus/test.hh>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// result stays trivial when T and E are trivial
static_assert(std::is_constructible_v<mc::result<int, int>, int>);
static_assert(std::is_constructible_v<mc::result<int, int>, mc::as_error_t<int>>);
static_assert(std::is_trivially_copyable_v<mc::result<int, int>>);
static_assert(std::is_trivially_destructible_v<mc::result<int, int>>);
static_assert(!std::is_trivially_copyable_v<mc::result<int, std::string>>);

// a result always comes from a producer that picked a variant
static_assert(!std::is_default_constructible_v<mc::result<int, int>>);

namespace
{
struct move_only
{
    int value = 0;

    move_only() = default;
    explicit move_only(int v) : value(v) {}

    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }

    ~move_only() = default;
};

// counts constructions and destructions to check balanced lifetimes
struct counting_type
{
    int value = 0;

    static inline int ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++ctor_count; }
    counting_type(counting_type const& rhs) : value(rhs.value) { ++ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++ctor_count; }
    counting_type& operator=(counting_type const&) = default;
    counting_type& operator=(counting_type&&) = default;

    ~counting_type() { ++dtor_count; }
};

// copying always fails, moving works
struct copy_failure
{
};

struct throwing_copy
{
    int value = 0;

    explicit throwing_copy(int v) : value(v) {}
    throwing_copy(throwing_copy const&) { throw copy_failure{}; }
    throwing_copy(throwing_copy&&) noexcept = default;
    throwing_copy& operator=(throwing_copy const&) = default;
    throwing_copy& operator=(throwing_copy&&) noexcept = default;
    ~throwing_copy() = default;
};

enum class parse_error
{
    empty,
    not_a_number,
    negative,
};

mc::result<int, parse_error> parse_digit(std::string const& s)
{
    if (s.empty())
        return mc::error(parse_error::empty);
    if (s.size() != 1 || s[0] < '0' || s[0] > '9')
        return mc::error(parse_error::not_a_number);
    return s[0] - '0';
}

mc::result<int, parse_error> non_zero(int x)
{
    if (x == 0)
        return mc::error(parse_error::negative);
    return x;
}

mc::result<int, parse_error> halve_even(int x)
{
    if (x % 2 != 0)
        return mc::error(parse_error::not_a_number);
    return x / 2;
}
} // namespace

TEST("result - trivial types")
{
    SECTION("value construction")
    {
        auto const res = mc::result<int, int>{42};
        CHECK(res.has_value());
        CHECK(!res.has_error());
        CHECK(res.value() == 42);
    }

    SECTION("error construction via mc::error")
    {
        auto const res = mc::result<int, int>{mc::error(99)};
        CHECK(!res.has_value());
        CHECK(res.has_error());
        CHECK(res.error() == 99);
    }

    SECTION("copy construction keeps the variant")
    {
        auto const ok = mc::result<int, int>{42};
        auto const err = mc::result<int, int>{mc::error(99)};
        auto const ok2 = ok;
        auto const err2 = err;
        CHECK(ok2.value() == 42);
        CHECK(err2.error() == 99);
    }

    SECTION("assignment switches the variant")
    {
        auto res = mc::result<int, int>{42};
        res = mc::result<int, int>{mc::error(7)};
        CHECK(res.has_error());
        CHECK(res.error() == 7);
        res = mc::result<int, int>{1};
        CHECK(res.value() == 1);
    }
}

TEST("result - non-trivial types")
{
    SECTION("string payloads")
    {
        auto const ok = mc::result<std::string, std::string>{"hello"};
        auto const err = mc::result<std::string, std::string>{mc::error("broken")};
        CHECK(ok.value() == "hello");
        CHECK(err.error() == "broken");
    }

    SECTION("move construction keeps the variant")
    {
        auto res1 = mc::result<std::string, int>{std::string("hello")};
        auto const res2 = mc::move(res1);
        CHECK(res2.value() == "hello");
        CHECK(res1.has_value());
    }

    SECTION("copy assignment - value to error")
    {
        auto res = mc::result<std::string, std::string>{"value"};
        auto const err = mc::result<std::string, std::string>{mc::error("error")};
        res = err;
        CHECK(res.has_error());
        CHECK(res.error() == "error");
    }

    SECTION("move assignment - error to value")
    {
        auto res = mc::result<std::string, std::string>{mc::error("error")};
        res = mc::result<std::string, std::string>{"value"};
        CHECK(res.has_value());
        CHECK(res.value() == "value");
    }

    SECTION("constructor and destructor balance")
    {
        counting_type::reset_counters();
        {
            auto res = mc::result<counting_type, counting_type>{counting_type{1}};
            res = mc::result<counting_type, counting_type>{mc::error(counting_type{2})};
            res = mc::result<counting_type, counting_type>{counting_type{3}};
            auto const copy = res;
            CHECK(copy.value().value == 3);
        }
        CHECK(counting_type::ctor_count == counting_type::dtor_count);
    }
}

TEST("result - assignment with a throwing copy")
{
    SECTION("error to value keeps the old error alive")
    {
        counting_type::reset_counters();
        {
            auto dst = mc::result<throwing_copy, counting_type>{mc::error(counting_type{1})};
            auto const src = mc::result<throwing_copy, counting_type>{throwing_copy{13}};

            bool caught = false;
            try
            {
                dst = src;
            }
            catch (copy_failure const&)
            {
                caught = true;
            }

            CHECK(caught);
            REQUIRE(dst.has_error());
            CHECK(dst.error().value == 1);
        }
        CHECK(counting_type::ctor_count == counting_type::dtor_count);
    }

    SECTION("value to error keeps the old value alive")
    {
        counting_type::reset_counters();
        {
            auto dst = mc::result<counting_type, throwing_copy>{counting_type{2}};
            auto const src = mc::result<counting_type, throwing_copy>{mc::error(throwing_copy{13})};

            bool caught = false;
            try
            {
                dst = src;
            }
            catch (copy_failure const&)
            {
                caught = true;
            }

            CHECK(caught);
            REQUIRE(dst.has_value());
            CHECK(dst.value().value == 2);
        }
        CHECK(counting_type::ctor_count == counting_type::dtor_count);
    }

    SECTION("switching variant without a throw still balances")
    {
        counting_type::reset_counters();
        {
            auto dst = mc::result<counting_type, int>{counting_type{3}};
            auto const src = mc::result<counting_type, int>{mc::error(4)};
            dst = src;
            CHECK(dst.error() == 4);
            dst = mc::result<counting_type, int>{counting_type{5}};
            CHECK(dst.value().value == 5);
        }
        CHECK(counting_type::ctor_count == counting_type::dtor_count);
    }
}

TEST("result - move-only types")
{
    SECTION("move-only value")
    {
        auto res = mc::result<move_only, int>{move_only{42}};
        auto const res2 = mc::move(res);
        CHECK(res2.value().value == 42);
    }

    SECTION("move-only error")
    {
        auto res = mc::result<int, move_only>{mc::error(move_only{99})};
        auto const moved = mc::move(res).error();
        CHECK(moved.value == 99);
    }

    SECTION("unique_ptr")
    {
        auto res = mc::result<std::unique_ptr<int>, std::string>{std::make_unique<int>(5)};
        auto const ptr = mc::move(res).value();
        CHECK(*ptr == 5);
    }
}

TEST("result - value_or and error_or")
{
    using int_result = mc::result<int, int>;

    CHECK(int_result{42}.value_or(99) == 42);
    CHECK(int_result{mc::error(0)}.value_or(99) == 99);
    CHECK(int_result{mc::error(99)}.error_or(0) == 99);
    CHECK(int_result{42}.error_or(99) == 99);

    auto res = mc::result<move_only, int>{move_only{42}};
    CHECK(mc::move(res).value_or(move_only{99}).value == 42);

    auto err = mc::result<move_only, int>{mc::error(0)};
    CHECK(mc::move(err).value_or(move_only{99}).value == 99);
}

TEST("result - converting constructor")
{
    SECTION("compatible value types")
    {
        auto res1 = mc::result<int, int>{42};
        auto const res2 = mc::result<long, long>{mc::move(res1)};
        CHECK(res2.has_value());
        CHECK(res2.value() == 42L);
    }

    SECTION("compatible error types")
    {
        auto const res1 = mc::result<int, int>{mc::error(99)};
        auto const res2 = mc::result<long, long>{res1};
        CHECK(res2.has_error());
        CHECK(res2.error() == 99L);
    }

    SECTION("string literal error into std::string")
    {
        auto res1 = mc::result<int, char const*>{mc::error("oops")};
        auto const res2 = mc::result<int, std::string>{mc::move(res1)};
        CHECK(res2.error() == "oops");
    }
}

TEST("result - equality operator")
{
    using res_t = mc::result<int, std::string>;

    CHECK(res_t{1} == res_t{1});
    CHECK(res_t{1} != res_t{2});
    CHECK(res_t{mc::error("a")} == res_t{mc::error("a")});
    CHECK(res_t{mc::error("a")} != res_t{mc::error("b")});

    // same payload bits, different variant
    using int_result = mc::result<int, int>;
    CHECK(int_result{3} != int_result{mc::error(3)});
}

TEST("result - map")
{
    SECTION("success maps the value")
    {
        auto const res = mc::result<int, std::string>{20};
        auto const mapped = res.map([](int x) { return x + 1; });
        CHECK(mapped.value() == 21);
    }

    SECTION("failure keeps the error and never invokes the callback")
    {
        int calls = 0;
        auto const res = mc::result<int, std::string>{mc::error("no connection")};
        auto const mapped = res.map(
            [&calls](int x)
            {
                ++calls;
                return x;
            });
        CHECK(mapped.has_error());
        CHECK(mapped.error() == "no connection");
        CHECK(calls == 0);
    }

    SECTION("changes the value type but not the error type")
    {
        auto const mapped = mc::result<int, parse_error>{7}.map([](int x) { return std::to_string(x); });
        static_assert(std::is_same_v<decltype(mapped), mc::result<std::string, parse_error> const>);
        CHECK(mapped.value() == "7");
    }

    SECTION("rvalue result with move-only error")
    {
        auto res = mc::result<int, move_only>{mc::error(move_only{3})};
        auto const mapped = mc::move(res).map([](int x) { return x * 2; });
        CHECK(mapped.error().value == 3);
    }

    SECTION("exceptions from the callback propagate")
    {
        bool caught = false;
        try
        {
            (void)mc::result<int, int>{1}.map([](int) -> int { throw std::logic_error("defect"); });
        }
        catch (std::logic_error const&)
        {
            caught = true;
        }
        CHECK(caught);
    }
}

TEST("result - and_then")
{
    SECTION("success returns the callback result directly")
    {
        auto const res = parse_digit("8").and_then(halve_even);
        static_assert(std::is_same_v<decltype(res), mc::result<int, parse_error> const>);
        CHECK(res.value() == 4);
    }

    SECTION("success may turn into failure")
    {
        auto const res = parse_digit("7").and_then(halve_even);
        CHECK(res.error() == parse_error::not_a_number);
    }

    SECTION("failure is passed through and the callback is never invoked")
    {
        int calls = 0;
        auto const res = parse_digit("").and_then(
            [&calls](int x) -> mc::result<int, parse_error>
            {
                ++calls;
                return x;
            });
        CHECK(res.error() == parse_error::empty);
        CHECK(calls == 0);
    }

    SECTION("exceptions from the callback propagate")
    {
        bool caught = false;
        try
        {
            (void)parse_digit("4").and_then([](int) -> mc::result<int, parse_error> { throw std::runtime_error("lookup failed"); });
        }
        catch (std::runtime_error const& e)
        {
            caught = std::string(e.what()) == "lookup failed";
        }
        CHECK(caught);
    }

    SECTION("associativity")
    {
        for (auto const* input : {"", "x", "0", "3", "4", "8"})
        {
            auto const c = parse_digit(input);
            auto const lhs = c.and_then(non_zero).and_then(halve_even);
            auto const rhs = c.and_then([](int x) { return non_zero(x).and_then(halve_even); });
            CHECK(lhs == rhs);
        }
    }
}

TEST("result - or_else")
{
    SECTION("success never invokes the callback")
    {
        int calls = 0;
        auto const res = mc::result<int, std::string>{5}.or_else(
            [&calls](std::string const&) -> mc::result<int, std::string>
            {
                ++calls;
                return 0;
            });
        CHECK(res.value() == 5);
        CHECK(calls == 0);
    }

    SECTION("failure may recover")
    {
        auto const res = parse_digit("").or_else(
            [](parse_error e) -> mc::result<int, parse_error>
            {
                if (e == parse_error::empty)
                    return 0;
                return mc::error(e);
            });
        CHECK(res.value() == 0);
    }

    SECTION("failure may re-fail with a different error")
    {
        auto const res = parse_digit("x").or_else([](parse_error) -> mc::result<int, parse_error>
                                                  { return mc::error(parse_error::negative); });
        CHECK(res.error() == parse_error::negative);
    }

    SECTION("failure may keep the original error")
    {
        int calls = 0;
        auto const res = parse_digit("x").or_else(
            [&calls](parse_error e) -> mc::result<int, parse_error>
            {
                ++calls;
                return mc::error(e);
            });
        CHECK(res.error() == parse_error::not_a_number);
        CHECK(calls == 1);
    }

    SECTION("exceptions from the callback propagate")
    {
        bool caught = false;
        try
        {
            (void)parse_digit("").or_else([](parse_error) -> mc::result<int, parse_error> { throw std::runtime_error("no fallback"); });
        }
        catch (std::runtime_error const& e)
        {
            caught = std::string(e.what()) == "no fallback";
        }
        CHECK(caught);
    }
}

TEST("result - usage patterns")
{
    SECTION("early return on error")
    {
        auto sum_digits = [](std::string const& a, std::string const& b) -> mc::result<int, parse_error>
        {
            auto const x = parse_digit(a);
            if (x.has_error())
                return x;

            return parse_digit(b).map([&](int y) { return x.value() + y; });
        };

        CHECK(sum_digits("4", "5").value() == 9);
        CHECK(sum_digits("", "5").error() == parse_error::empty);
        CHECK(sum_digits("4", "?").error() == parse_error::not_a_number);
    }

    SECTION("value_or for default fallback")
    {
        auto const retries = parse_digit("not set").value_or(3);
        CHECK(retries == 3);
    }
}

#if MC_ASSERT_ENABLED
TEST("result - accessing the inactive variant asserts")
{
    struct precondition_violation
    {
    };

    auto handler = mc::impl::scoped_assertion_handler([](mc::impl::assertion_info const&)
                                                      { throw precondition_violation{}; });

    auto const ok = mc::result<int, int>{1};
    auto const err = mc::result<int, int>{mc::error(2)};

    int asserted = 0;
    try
    {
        (void)ok.error();
    }
    catch (precondition_violation const&)
    {
        ++asserted;
    }
    try
    {
        (void)err.value();
    }
    catch (precondition_violation const&)
    {
        ++asserted;
    }
    CHECK(asserted == 2);
}
#endif
