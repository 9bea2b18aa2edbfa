// test_dynamic.cpp – Fields sized or typed at decode time: Array,
// MetaStructure, Data and MetaField.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_dynamic

#include "BitPacket/BitPacket.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bitpacket;

// ─── Utility ─────────────────────────────────────────────────────────────────

static void hexdump(const std::vector<uint8_t>& v, const std::string& label) {
    std::cout << label << " [" << v.size() << "B]: ";
    for (uint8_t b : v)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b << ' ';
    std::cout << std::dec << '\n';
}

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

#define CHECK_THROWS(expr, Exc, msg)                                      \
    do {                                                                   \
        bool thrown_ = false;                                              \
        try { expr; } catch (const Exc&) { thrown_ = true; }               \
        CHECK(thrown_, msg);                                               \
    } while(0)

// ─── Factories ───────────────────────────────────────────────────────────────

static std::unique_ptr<Field> makeU32(const Field&) {
    return std::make_unique<Number>("value", UInt32);
}

static std::unique_ptr<Field> makePair(const Field&) {
    auto pair = std::make_unique<Structure>("pair");
    pair->add<Number>("a", UInt8);
    pair->add<Number>("b", UInt8);
    return pair;
}

// UInt16 when the Context's "kind" is 2, UInt8 otherwise.
static std::unique_ptr<Field> makeByKind(const Field& ctx) {
    if (toUnsigned(ctx.get("kind")) == 2)
        return std::make_unique<Number>("v", UInt16);
    return std::make_unique<Number>("v", UInt8);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: Counted array of UInt32
//
//  02 | 00 00 00 0A | 00 00 00 14  →  count = 2, "0" = 10, "1" = 20
// ─────────────────────────────────────────────────────────────────────────────
static void testArrayDecode() {
    std::cout << "\n=== Test: Array decode ===\n";

    Array values{"values", std::make_unique<Number>("count", UInt8), makeU32};
    const Bytes wire{0x02, 0x00, 0x00, 0x00, 0x0A, 0x00, 0x00, 0x00, 0x14};
    values.setBytes(wire);

    CHECK(values.length() == 2,                     "2 elements materialized");
    CHECK(toUnsigned(values.counter().value()) == 2, "counter = 2");
    CHECK(toUnsigned(values.get("0")) == 10,        "element \"0\" = 10");
    CHECK(toUnsigned(values.get("1")) == 20,        "element \"1\" = 20");
    CHECK(values.element(1).name() == "1",          "elements named by index");
    CHECK(values.size() == 9,                       "size = counter + 2 × 4");
    hexdump(values.bytes(), "re-encoded");
    CHECK(values.bytes() == wire,                   "re-encodes to the same bytes");

    const Bytes shorter{0x01, 0x00, 0x00, 0x01, 0x00};
    values.setBytes(shorter);
    CHECK(values.length() == 1,                     "second decode drops stale elements");
    CHECK(toUnsigned(values.get("0")) == 256,       "new element value");
    CHECK_THROWS((void)values.field("1"),           KeyNotFound, "old element \"1\" is gone");

    const Bytes empty{0x00};
    values.setBytes(empty);
    CHECK(values.length() == 0 && values.size() == 1, "count 0 → no elements");

    const Bytes truncated{0x03, 0x00, 0x00, 0x00, 0x01};
    CHECK_THROWS(values.setBytes(truncated),        StreamLengthMismatch,
                 "count larger than the input → StreamLengthMismatch");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Counter always equals the number of elements
// ─────────────────────────────────────────────────────────────────────────────
static void testCounterConsistency() {
    std::cout << "\n=== Test: Counter consistency ===\n";

    Array values{"values", std::make_unique<Number>("count", UInt8), makeU32};
    CHECK(toUnsigned(values.counter().value()) == 0, "new array: counter = 0");

    for (int i = 0; i < 3; ++i) {
        auto v = std::make_unique<Number>("anything", UInt32);
        v->setValue(i * 100);
        values.append(std::move(v));
        CHECK(toUnsigned(values.counter().value()) == values.length(),
              "counter follows append #" + std::to_string(i));
    }
    CHECK(toUnsigned(values.get("2")) == 200,       "appended element renamed to \"2\"");

    CHECK_THROWS(values.set("count", 9),            ReadOnlyField, "counter is read-only");
    CHECK_THROWS(values.append(std::make_unique<Number>("x", UInt16)), TypeError,
                 "UInt16 element in a UInt32 array → TypeError");
    CHECK_THROWS(values.append(std::make_unique<String>("x", Bytes(4, 0))), TypeError,
                 "String element in a UInt32 array → TypeError");
    CHECK(values.length() == 3,                     "failed appends leave 3 elements");

    // Index assignment: existing, one past the end, beyond.
    values.set("1", 111);
    CHECK(toUnsigned(values.get("1")) == 111,       "assign existing index");
    values.set("3", 333);
    CHECK(values.length() == 4 && toUnsigned(values.counter().value()) == 4,
          "assign one past the end appends");
    CHECK_THROWS(values.set("5", 1),                IndexError, "index 5 with length 4 → IndexError");
    CHECK_THROWS(values.set("4", int64_t{1} << 40), SizeExceeded, "auto-append with a bad value");
    CHECK(values.length() == 4 && toUnsigned(values.counter().value()) == 4,
          "bad auto-append rolled back");
    CHECK_THROWS(values.set("x", 1),                KeyNotFound, "non-index key → KeyNotFound");
    CHECK_THROWS((void)values.element(4),           IndexError,  "element(4) past the end");

    CHECK_THROWS(Array("bad", std::make_unique<Number>("0", UInt8), makeU32), std::invalid_argument,
                 "counter named like an index is rejected");

    // A UInt8 counter caps the array at 255 elements.
    Array full{"full", std::make_unique<Number>("count", UInt8), makeU32};
    for (int i = 0; i < 255; ++i)
        full.append(std::make_unique<Number>("v", UInt32));
    CHECK_THROWS(full.append(std::make_unique<Number>("v", UInt32)), SizeExceeded,
                 "256th element does not fit the counter");
    CHECK(full.length() == 255 && toUnsigned(full.counter().value()) == 255,
          "overflowing element removed again");

    // Decode N → exactly N elements.
    Bytes wire{0x05};
    for (int i = 0; i < 5; ++i) wire.insert(wire.end(), {0x00, 0x00, 0x00, uint8_t(i)});
    values.setBytes(wire);
    CHECK(values.length() == 5 && toUnsigned(values.counter().value()) == 5,
          "decoding count 5 yields 5 elements");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: Array of structures, built by index assignment
//
//  n = 2 | {a=1, b=2} | {a=0, b=5}  →  02 01 02 00 05
// ─────────────────────────────────────────────────────────────────────────────
static void testArrayOfStructures() {
    std::cout << "\n=== Test: Array of structures ===\n";

    Array pairs{"pairs", std::make_unique<Number>("n", UInt8), makePair};
    pairs.set("0.a", 1);
    pairs.set("0.b", 2);
    pairs.set("1.b", 5);

    const Bytes expected{0x02, 0x01, 0x02, 0x00, 0x05};
    hexdump(pairs.bytes(), "pairs");
    CHECK(pairs.bytes() == expected,                "nested paths auto-append elements");

    const std::vector<std::string> keys{"n", "0.a", "0.b", "1.a", "1.b"};
    CHECK(pairs.keys() == keys,                     "keys() lists counter and elements");

    Array copy{"pairs", std::make_unique<Number>("n", UInt8), makePair};
    copy.setBytes(expected);
    CHECK(toUnsigned(copy.get("1.b")) == 5,         "decoded into a fresh tree");

    CHECK_THROWS(pairs.set("3.a", 1),               IndexError, "3.a with length 2 → IndexError");
    CHECK_THROWS(pairs.set("2.c", 1),               KeyNotFound, "unknown member on auto-append");
    CHECK(pairs.length() == 2,                      "failed auto-append rolled back");

    Structure outer{"outer"};
    auto& inner = outer.add<Array>("pairs", std::make_unique<Number>("n", UInt8), makePair);
    outer.setBytes(expected);
    CHECK(inner.length() == 2,                      "array nested in a structure decodes");
    outer.reset();
    CHECK(inner.length() == 0 && toUnsigned(outer.get("pairs.n")) == 0,
          "reset() empties nested arrays");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: MetaStructure counted by a preceding field
//
//  n = 2 | 00 01 | 00 02
// ─────────────────────────────────────────────────────────────────────────────
static void testMetaStructure() {
    std::cout << "\n=== Test: MetaStructure ===\n";

    Structure list{"list"};
    list.add<Number>("n", UInt8);
    auto& items = list.add<MetaStructure>(
        "items",
        [](const Field& ctx) { return static_cast<size_t>(toUnsigned(ctx.get("n"))); },
        [](const Field&) { return std::make_unique<Number>("item", UInt16); });

    const Bytes wire{0x02, 0x00, 0x01, 0x00, 0x02};
    list.setBytes(wire);
    CHECK(items.length() == 2,                      "2 items materialized");
    CHECK(toUnsigned(list.get("items.1")) == 2,     "items.1 = 2");
    CHECK(list.bytes() == wire,                     "re-encodes to the same bytes");

    list.set("n", 3);
    CHECK_THROWS((void)list.bytes(),                LengthMismatch,
                 "count 3 but 2 items → LengthMismatch at encode");
    list.set("items.2", 9);
    const Bytes three{0x03, 0x00, 0x01, 0x00, 0x02, 0x00, 0x09};
    CHECK(list.bytes() == three,                    "assign one past the end appends");
    CHECK_THROWS(list.set("items.4", 1),            IndexError, "items.4 with length 3 → IndexError");

    const Bytes one{0x01, 0x00, 0x0A};
    list.setBytes(one);
    CHECK(items.length() == 1 && toUnsigned(list.get("items.0")) == 10,
          "second decode rebuilds the items");

    Structure backwards{"backwards"};
    backwards.add<MetaStructure>(
        "items",
        [](const Field& ctx) { return static_cast<size_t>(toUnsigned(ctx.get("n"))); },
        [](const Field&) { return std::make_unique<Number>("item", UInt8); });
    backwards.add<Number>("n", UInt8);
    CHECK_THROWS(backwards.setBytes(one),           KeyNotFound,
                 "count from a later field → KeyNotFound");

    MetaStructure fixed{"fixed", 2, [](const Field&) { return std::make_unique<Number>("b", UInt8); }};
    const Bytes ab{0x0A, 0x0B};
    fixed.setBytes(ab);
    CHECK(fixed.length() == 2 && toUnsigned(fixed.get("1")) == 0x0B, "literal count");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: Data keeps its length field in sync
// ─────────────────────────────────────────────────────────────────────────────
static void testData() {
    std::cout << "\n=== Test: Data ===\n";

    Data data{"data", std::make_unique<Number>("Length", UInt8)};
    const Bytes text{'a', 'b', 'c', 'd', 'e', 'f'};
    data.setValue(text);
    CHECK(toUnsigned(data.get("Length")) == 6,      "Length = 6");
    CHECK(toBytes(data.value()) == text,            "value() = content");
    CHECK(data.strValue() == "0x616263646566",      "strValue renders the content");
    const Bytes wire{0x06, 'a', 'b', 'c', 'd', 'e', 'f'};
    CHECK(data.bytes() == wire,                     "length precedes content");

    CHECK_THROWS(data.setValue(Bytes(256, 'x')),    ValueTooLong, "256 words do not fit UInt8");
    CHECK(toUnsigned(data.get("Length")) == 6,      "Length unchanged after ValueTooLong");

    Data words{"words", std::make_unique<Number>("Length", UInt8), 4};
    words.setValue(Bytes(12, 'w'));
    CHECK(toUnsigned(words.get("Length")) == 3,     "12 bytes / word size 4 = 3 words");
    CHECK_THROWS(words.setValue(Bytes(10, 'w')),    LengthMismatch, "10 bytes is not whole words");

    // Word size taken from a preceding field.
    Structure packet{"packet"};
    packet.add<Number>("WSize", UInt8);
    packet.add<Data>("data", std::make_unique<Number>("Length", UInt8),
                     [](const Field& ctx) { return static_cast<size_t>(toUnsigned(ctx.get("WSize"))); });
    const Bytes buffer{2, 3, 40, 55, 22, 45, 34, 89};
    packet.setBytes(buffer);
    CHECK(toUnsigned(packet.get("data.Length")) == 3,          "3 words of 2 bytes");
    CHECK(packet["data.Data"].strHexValue() == "0x2837162D2259", "content = 6 bytes");
    CHECK(packet.bytes() == buffer,                            "re-encodes to the same bytes");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: MetaField before and after materialization
// ─────────────────────────────────────────────────────────────────────────────
static void testMetaFieldLifecycle() {
    std::cout << "\n=== Test: MetaField lifecycle ===\n";

    MetaField meta{"meta", [](const Field&) { return std::make_unique<Number>("n", UInt8); }};
    CHECK(meta.name() == "meta" && !meta.materialized(), "unbound MetaField keeps its name");
    CHECK_THROWS((void)meta.size(),                 NotMaterialized, "size() before decode");
    CHECK_THROWS((void)meta.value(),                NotMaterialized, "value() before decode");
    CHECK_THROWS(meta.setValue(1),                  NotMaterialized, "setValue() before decode");
    CHECK_THROWS((void)meta.strValue(),             NotMaterialized, "strValue() before decode");
    CHECK_THROWS((void)meta.strHexValue(),          NotMaterialized, "strHexValue() before decode");
    CHECK_THROWS((void)meta.bytes(),                NotMaterialized, "encode before decode");
    CHECK_THROWS((void)meta.fields(),               NotMaterialized, "fields() before decode");

    const Bytes wire{0x2A};
    meta.setBytes(wire);
    Number plain{"plain", UInt8, 42};
    CHECK(meta.materialized(),                      "decode materializes");
    CHECK(toUnsigned(meta.value()) == 42,           "value() = 42");
    CHECK(meta.size() == plain.size(),              "size() like a plain UInt8");
    CHECK(meta.strValue() == plain.strValue(),      "strValue() like a plain UInt8");
    CHECK(meta.bytes() == plain.bytes(),            "bytes() like a plain UInt8");
    CHECK(meta.delegate().name() == "meta",         "delegate takes the MetaField's name");
    CHECK(meta.delegate().parent() == &meta,        "delegate parent is the MetaField");

    meta.setCalibration([](const Value& v) { return Value{toUnsigned(v) * 2}; });
    CHECK(meta.strEngValue() == "84",               "calibration on the MetaField applies");

    meta.reset();
    CHECK(!meta.materialized(),                     "reset() drops the delegate");
    CHECK_THROWS((void)meta.value(),                NotMaterialized, "value() after reset");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 7: MetaField type chosen by a preceding tag
// ─────────────────────────────────────────────────────────────────────────────
static void testMetaFieldDispatch() {
    std::cout << "\n=== Test: MetaField dispatch ===\n";

    auto payload = [](const Field& ctx) -> std::unique_ptr<Field> {
        if (toUnsigned(ctx.get("tag")) == 1)
            return std::make_unique<Number>("p", UInt16);
        return std::make_unique<Number>("p", UInt32);
    };

    Structure msg{"msg"};
    msg.add<Number>("tag", UInt8);
    auto& meta = msg.add<MetaField>("payload", payload);

    const Bytes short_msg{0x01, 0x00, 0x05};
    msg.setBytes(short_msg);
    CHECK(meta.size() == 2 && toUnsigned(msg.get("payload")) == 5, "tag 1 → UInt16 payload");

    const Bytes long_msg{0x02, 0x00, 0x00, 0x00, 0x07};
    msg.setBytes(long_msg);
    CHECK(meta.size() == 4 && toUnsigned(msg.get("payload")) == 7, "tag 2 → UInt32 payload");
    CHECK(msg.size() == 5 && msg.bytes() == long_msg, "re-encodes the UInt32 variant");

    // Encoding a fresh tree: bind explicitly once the tag is known.
    Structure out{"out"};
    out.add<Number>("tag", UInt8, 1);
    auto& out_meta = out.add<MetaField>("payload", payload);
    CHECK_THROWS(out.set("payload", 0x0102),        NotMaterialized, "assign before bind");
    out_meta.bind(out);
    out.set("payload", 0x0102);
    const Bytes expected{0x01, 0x01, 0x02};
    hexdump(out.bytes(), "bound");
    CHECK(out.bytes() == expected,                  "bind() then encode");

    out.reset();
    CHECK(!out_meta.materialized(),                 "container reset() reaches the MetaField");

    // Bit-level MetaField inside a BitStructure.
    BitStructure hdr{"hdr"};
    hdr.add<BitField>("version", 4);
    hdr.add<MetaField>("rest", [](const Field& ctx) -> std::unique_ptr<Field> {
        return std::make_unique<BitField>("rest", 8 - toUnsigned(ctx.get("version")));
    });
    const Bytes octet{0x4F};
    hdr.setBytes(octet);
    CHECK(hdr["rest"].bitSize() == 4 && toUnsigned(hdr.get("rest")) == 0xF,
          "MetaField sized by a preceding bit field");

    // Structured delegate: keys() and paths reach through the MetaField.
    Structure frame{"frame"};
    frame.add<Number>("tag", UInt8);
    auto& body = frame.add<MetaField>("body", makePair);
    const std::vector<std::string> unbound_keys{"tag", "body"};
    CHECK(frame.keys() == unbound_keys,             "unbound MetaField lists as a leaf");
    const Bytes framed{0x01, 0x02, 0x03};
    frame.setBytes(framed);
    const std::vector<std::string> keys{"tag", "body.a", "body.b"};
    CHECK(frame.keys() == keys,                     "keys() expands a bound MetaField");
    CHECK(toUnsigned(frame.get("body.b")) == 3,     "body.b = 3");
    body.field("a").setValue(9);
    CHECK(toUnsigned(frame.get("body.a")) == 9,     "non-const field() through the delegate");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 8: Array of MetaFields
//
//  kind = 2 | count = 2 | 00 07 | 00 08
// ─────────────────────────────────────────────────────────────────────────────
static void testArrayOfMetaFields() {
    std::cout << "\n=== Test: Array of MetaFields ===\n";

    auto element = [](const Field&) -> std::unique_ptr<Field> {
        return std::make_unique<MetaField>("v", makeByKind);
    };

    Structure rec{"rec"};
    rec.add<Number>("kind", UInt8);
    auto& values = rec.add<Array>("values", std::make_unique<Number>("count", UInt8), element);

    const Bytes wire{0x02, 0x02, 0x00, 0x07, 0x00, 0x08};
    rec.setBytes(wire);
    CHECK(values.length() == 2,                     "2 MetaField elements");
    CHECK(values.element(0).size() == 2,            "elements materialized as UInt16");
    CHECK(toUnsigned(rec.get("values.1")) == 8,     "values.1 = 8");
    CHECK(rec.bytes() == wire,                      "re-encodes to the same bytes");

    rec.set("kind", 1);
    rec.reset();
    CHECK_THROWS(values.append(std::make_unique<Number>("x", UInt16)), TypeError,
                 "kind 1 elements are UInt8, not UInt16");
    values.append(std::make_unique<Number>("x", UInt8));
    rec.set("values.1", 200);
    CHECK(values.length() == 2 && values.element(1).size() == 1,
          "auto-appended MetaField bound with the current kind");

    values.append(std::make_unique<MetaField>("w", makeByKind));
    CHECK(values.length() == 3 && values.element(2).size() == 1,
          "unbound MetaField is bound on append");
    CHECK_THROWS(values.append(std::make_unique<MetaField>("w", makeU32)), TypeError,
                 "unbound MetaField of another type → TypeError");
    CHECK(values.length() == 3,                     "rejected MetaField not appended");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 9: Elements that consume no input
//
//  FF FF  →  65535 empty structures from two bytes: rejected
// ─────────────────────────────────────────────────────────────────────────────
static void testZeroSizeElements() {
    std::cout << "\n=== Test: Zero-size elements ===\n";

    auto empty = [](const Field&) -> std::unique_ptr<Field> {
        return std::make_unique<Structure>("empty");
    };

    Array values{"values", std::make_unique<Number>("count", UInt16), empty};
    const Bytes few{0x00, 0x03};
    values.setBytes(few);
    CHECK(values.length() == 3,                     "a few empty elements decode");

    const Bytes huge{0xFF, 0xFF};
    CHECK_THROWS(values.setBytes(huge),             LengthMismatch,
                 "65535 empty elements from 2 bytes → LengthMismatch");

    Structure rec{"rec"};
    rec.add<Number>("n", UInt32);
    rec.add<MetaStructure>("items",
                           [](const Field& ctx) -> size_t { return toUnsigned(ctx.get("n")); },
                           empty);
    const Bytes many{0x00, 0x10, 0x00, 0x00};
    CHECK_THROWS(rec.setBytes(many),                LengthMismatch,
                 "MetaStructure of 2^20 empty elements → LengthMismatch");
}

int main() {
    testArrayDecode();
    testCounterConsistency();
    testArrayOfStructures();
    testMetaStructure();
    testData();
    testMetaFieldLifecycle();
    testMetaFieldDispatch();
    testArrayOfMetaFields();
    testZeroSizeElements();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
