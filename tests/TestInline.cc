#include <gtest/gtest.h>

#include <bitset>

#include "ndl-core/feedback.hh"
#include "ndl-core/object.hh"

///
/// INLINE TAG TESTS
/// - the bit layout is shared by every image: these pin it down
///

#define BITS(it) std::bitset<64>((it.as_raw()))
#define DBG_PRINT(it) std::cerr << "             " << it << std::endl

TEST(InlineTests, IntTagTests) {
    ndl::OBJECT i1 = ndl::OBJECT::make_int(5);
    DBG_PRINT("IntTagTests: BITSET: " << BITS(i1));
    EXPECT_EQ(i1.as_raw(), (ndl::Word{5} << 3) | 0x1);
    EXPECT_EQ(i1.kind(), ndl::InlineKind::Int);
    EXPECT_EQ(i1.as_int(), 5);

    EXPECT_TRUE(i1.is_int());
    EXPECT_FALSE(i1.is_ptr());
    EXPECT_FALSE(i1.is_builtin());
    EXPECT_FALSE(i1.is_symbol());
    EXPECT_FALSE(i1.is_handle());
}
TEST(InlineTests, NegativeIntsSignExtend) {
    ndl::OBJECT i1 = ndl::OBJECT::make_int(-1);
    EXPECT_EQ(i1.as_raw() & 0x7, 0x1u);
    EXPECT_EQ(i1.as_int(), -1);

    ndl::OBJECT lo = ndl::OBJECT::make_int(ndl::OBJECT::INT_MIN_INLINE);
    ndl::OBJECT hi = ndl::OBJECT::make_int(ndl::OBJECT::INT_MAX_INLINE);
    EXPECT_EQ(lo.as_int(), ndl::OBJECT::INT_MIN_INLINE);
    EXPECT_EQ(hi.as_int(), ndl::OBJECT::INT_MAX_INLINE);
    EXPECT_TRUE(ndl::OBJECT::int_fits_inline(ndl::OBJECT::INT_MAX_INLINE));
    EXPECT_FALSE(ndl::OBJECT::int_fits_inline(ndl::OBJECT::INT_MAX_INLINE + 1));
    EXPECT_FALSE(ndl::OBJECT::int_fits_inline(ndl::OBJECT::INT_MIN_INLINE - 1));
}
TEST(InlineTests, BuiltinTagTests) {
    ndl::OBJECT b = ndl::OBJECT::make_builtin(42);
    EXPECT_EQ(b.as_raw(), (ndl::Word{42} << 3) | 0x2);
    EXPECT_EQ(b.kind(), ndl::InlineKind::Builtin);
    EXPECT_EQ(b.as_builtin(), 42u);
}
TEST(InlineTests, SymbolTagTests) {
    ndl::OBJECT s = ndl::OBJECT::make_symbol(9);
    EXPECT_EQ(s.as_raw(), (ndl::Word{9} << 3) | 0x3);
    EXPECT_EQ(s.kind(), ndl::InlineKind::Symbol);
    EXPECT_EQ(s.as_symbol(), 9u);
    EXPECT_TRUE(s.is_symbol(9));
    EXPECT_FALSE(s.is_symbol(10));

    EXPECT_TRUE(ndl::OBJECT::make_bool(true).is_symbol(ndl::sym::True));
    EXPECT_TRUE(ndl::OBJECT::make_bool(false).is_symbol(ndl::sym::False));
}
TEST(InlineTests, HandleTagTests) {
    ndl::OBJECT h = ndl::OBJECT::make_handle(0xABCD, 3);
    DBG_PRINT("HandleTagTests: BITSET: " << BITS(h));
    EXPECT_EQ(h.as_raw(), (ndl::Word{0xABCD} << 32) | (ndl::Word{3} << 3) | 0x4);
    EXPECT_EQ(h.kind(), ndl::InlineKind::Handle);
    EXPECT_EQ(h.handle_id(), 0xABCDu);
    EXPECT_EQ(h.handle_argc(), 3u);

    ndl::OBJECT widest = ndl::OBJECT::make_handle(0xFFFFFFFF, ndl::OBJECT::HANDLE_ARGC_MAX);
    EXPECT_EQ(widest.handle_id(), 0xFFFFFFFFu);
    EXPECT_EQ(widest.handle_argc(), ndl::OBJECT::HANDLE_ARGC_MAX);
}
TEST(InlineTests, PtrTagTests) {
    alignas(8) ndl::Word storage[2] = {0, 0};
    ndl::OBJECT p = ndl::OBJECT::make_ptr(storage);
    EXPECT_EQ(p.as_raw() & 0x7, 0x0u);
    EXPECT_EQ(p.kind(), ndl::InlineKind::Pointer);
    EXPECT_TRUE(p.is_ptr());
    EXPECT_EQ(p.as_ptr(), storage);
}
TEST(InlineTests, InvalidTagsAreFatal) {
    for (ndl::Word tag: {ndl::Word{0x5}, ndl::Word{0x6}, ndl::Word{0x7}}) {
        ndl::OBJECT bad{(ndl::Word{1} << 3) | tag};
        EXPECT_THROW(bad.kind(), ndl::FatalError);
    }
    EXPECT_TRUE(ndl::OBJECT::none.is_none());
    EXPECT_FALSE(ndl::OBJECT::none.is_ptr());
    EXPECT_THROW(ndl::OBJECT::none.kind(), ndl::FatalError);
}
