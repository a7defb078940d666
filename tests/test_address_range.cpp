#include "minerscan/scan/AddressRange.hpp"
#include "minerscan/core/Errors.hpp"
#include "support/TestSupport.hpp"

#include <set>
#include <string>
#include <vector>

using namespace minerscan;
using namespace minerscan::scan;

static void testExpandsInclusiveRangeInOrder() {
    auto range = AddressRange::parse("10.0.81.0", "10.0.81.3");
    ASSERT_TRUE(range.has_value(), "parse succeeds");
    if (!range) return;

    std::vector<std::string> seen;
    for (const auto& address : *range) {
        seen.push_back(address.to_string());
    }
    const std::vector<std::string> expected{"10.0.81.0", "10.0.81.1", "10.0.81.2", "10.0.81.3"};
    ASSERT_TRUE(seen == expected, "four ascending addresses");
    ASSERT_EQ(range->size(), std::uint64_t{4}, "size is end - start + 1");
}

static void testCrossesOctetBoundary() {
    auto range = AddressRange::parse("192.168.0.250", "192.168.1.5");
    ASSERT_TRUE(range.has_value(), "parse succeeds");
    if (!range) return;

    std::set<std::uint32_t> distinct;
    std::uint32_t previous = 0;
    bool ascending = true;
    for (const auto& address : *range) {
        if (!distinct.empty() && address.to_uint() <= previous) ascending = false;
        previous = address.to_uint();
        distinct.insert(address.to_uint());
    }
    ASSERT_EQ(distinct.size(), std::size_t{12}, "12 distinct addresses");
    ASSERT_TRUE(ascending, "strictly ascending");
    ASSERT_EQ(range->toString(), std::string("192.168.0.250-192.168.1.5"), "long form");
}

static void testSingleAddressAndTopOfSpace() {
    auto single = AddressRange::parse("10.1.1.1", "10.1.1.1");
    ASSERT_TRUE(single.has_value(), "single address range");
    if (single) {
        ASSERT_EQ(single->size(), std::uint64_t{1}, "one address");
        ASSERT_EQ(single->toString(), std::string("10.1.1.1"), "single renders bare");
    }

    auto top = AddressRange::parse("255.255.255.254", "255.255.255.255");
    ASSERT_TRUE(top.has_value(), "top of the address space");
    if (top) {
        std::size_t count = 0;
        for (auto it = top->begin(); it != top->end(); ++it) ++count;
        ASSERT_EQ(count, std::size_t{2}, "iteration terminates past 255.255.255.255");
    }
}

static void testRejectsInvalidInput() {
    auto reversed = AddressRange::parse("10.0.0.9", "10.0.0.1");
    ASSERT_TRUE(!reversed, "end before start rejected");
    if (!reversed) {
        ASSERT_TRUE(reversed.error() == RangeError::InvalidRange, "InvalidRange");
    }

    const char* bad[] = {"", "10.0.0", "10.0.0.256", "10.0.0.1.", "a.b.c.d", "10..0.1", "10.0.0.1x", "1000.0.0.1"};
    for (const char* text : bad) {
        auto parsed = AddressRange::parse(text, "10.0.0.1");
        ASSERT_TRUE(!parsed, text);
    }
    ASSERT_TRUE(!AddressRange::parse("10.0.0.1", "10.0.0.").has_value(), "bad end rejected");
}

static void testSavedRangeShorthand() {
    auto shorthand = AddressRange::parse("10.0.81.1-254");
    ASSERT_TRUE(shorthand.has_value(), "shorthand parses");
    if (shorthand) {
        ASSERT_EQ(shorthand->first().to_string(), std::string("10.0.81.1"), "first");
        ASSERT_EQ(shorthand->last().to_string(), std::string("10.0.81.254"), "last");
        ASSERT_EQ(shorthand->toString(), std::string("10.0.81.1-254"), "renders shorthand");
    }

    auto explicitForm = AddressRange::parse(" 10.0.80.0-10.0.81.255 ");
    ASSERT_TRUE(explicitForm.has_value(), "explicit form parses");
    if (explicitForm) {
        ASSERT_EQ(explicitForm->size(), std::uint64_t{512}, "two /24s");
    }

    ASSERT_TRUE(!AddressRange::parse("10.0.81.9-3").has_value(), "descending shorthand rejected");
    ASSERT_TRUE(!AddressRange::parse("10.0.81.1-").has_value(), "missing end rejected");
    ASSERT_TRUE(AddressRange::parse("10.0.81.7").has_value(), "bare address accepted");
}

static void testContainsAndRestart() {
    auto range = AddressRange::parse("10.0.0.10-20");
    if (!range) {
        ASSERT_TRUE(false, "parse succeeds");
        return;
    }
    ASSERT_TRUE(range->contains(net::make_address_v4("10.0.0.15")), "inside");
    ASSERT_TRUE(!range->contains(net::make_address_v4("10.0.0.21")), "outside");

    std::size_t first = 0;
    std::size_t second = 0;
    for (auto a : *range) { (void)a; ++first; }
    for (auto a : *range) { (void)a; ++second; }
    ASSERT_EQ(first, second, "iteration is restartable");
}

int main() {
    testing::silenceInfoLogs();
    testExpandsInclusiveRangeInOrder();
    testCrossesOctetBoundary();
    testSingleAddressAndTopOfSpace();
    testRejectsInvalidInput();
    testSavedRangeShorthand();
    testContainsAndRestart();
    return testing::finishTests("AddressRange");
}
