#include <doctest/doctest.h>
#include "ninotnc/kiss.hpp"

#include <vector>

using namespace ninotnc;
using Bytes = std::vector<uint8_t>;

// Inverse of kiss::escape, test-only. Returns false on a dangling or unknown escape.
static bool unescape(const Bytes& in, Bytes& out) {
    out.clear();
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != kiss::FESC) { out.push_back(in[i]); continue; }
        if (++i == in.size()) return false;
        if      (in[i] == kiss::TFEND) out.push_back(kiss::FEND);
        else if (in[i] == kiss::TFESC) out.push_back(kiss::FESC);
        else return false;
    }
    return true;
}

TEST_CASE("escape replaces FEND and FESC, passes everything else through in order") {
    CHECK(kiss::escape(Bytes{}) == Bytes{});
    CHECK(kiss::escape(Bytes{0x00, 0x13, 0xFF}) == Bytes{0x00, 0x13, 0xFF});
    CHECK(kiss::escape(Bytes{0xC0}) == Bytes{0xDB, 0xDC});
    CHECK(kiss::escape(Bytes{0xDB}) == Bytes{0xDB, 0xDD});
    CHECK(kiss::escape(Bytes{0x01, 0xC0, 0x02, 0xDB, 0x03})
          == Bytes{0x01, 0xDB, 0xDC, 0x02, 0xDB, 0xDD, 0x03});

    // escape bytes that merely look like codes are not special on their own
    CHECK(kiss::escape(Bytes{0xDC, 0xDD}) == Bytes{0xDC, 0xDD});
}

TEST_CASE("escape output never carries a raw FEND and every FESC starts a valid pair") {
    Bytes all;
    for (int b = 0; b < 256; ++b) all.push_back(static_cast<uint8_t>(b));

    Bytes esc = kiss::escape(all);
    CHECK(esc.size() == all.size() + 2);   // exactly two bytes grew

    for (std::size_t i = 0; i < esc.size(); ++i) {
        CHECK(esc[i] != kiss::FEND);
        if (esc[i] == kiss::FESC) {
            REQUIRE(i + 1 < esc.size());
            CHECK((esc[i + 1] == kiss::TFEND || esc[i + 1] == kiss::TFESC));
            ++i;
        }
    }

    Bytes back;
    REQUIRE(unescape(esc, back));
    CHECK(back == all);
}

TEST_CASE("escape appends to a non-empty buffer") {
    Bytes out{0xAA};
    const uint8_t in[] = {0xC0, 0x05};
    kiss::escape(in, sizeof(in), out);
    CHECK(out == Bytes{0xAA, 0xDB, 0xDC, 0x05});
}

TEST_CASE("build_frame wraps command and escaped payload in FEND") {
    CHECK(kiss::build_frame(0x06, {0x03}) == Bytes{0xC0, 0x06, 0x03, 0xC0});
    CHECK(kiss::build_frame(0x06, {0xC0}) == Bytes{0xC0, 0x06, 0xDB, 0xDC, 0xC0});
    CHECK(kiss::build_frame(0x06, {0xDB}) == Bytes{0xC0, 0x06, 0xDB, 0xDD, 0xC0});
    CHECK(kiss::build_frame(kiss::CMD_DATA, {}) == Bytes{0xC0, 0x00, 0xC0});

    Bytes payload{0xC0, 0xC0, 0x7E, 0xDB};
    for (int cmd = 0; cmd < 256; cmd += 17) {
        Bytes f = kiss::build_frame(static_cast<uint8_t>(cmd), payload);
        REQUIRE(f.size() >= 3);
        CHECK(f.front() == kiss::FEND);
        CHECK(f.back() == kiss::FEND);
        CHECK(f[1] == cmd);

        Bytes body(f.begin() + 2, f.end() - 1), back;
        REQUIRE(unescape(body, back));
        CHECK(back == payload);
    }
}

TEST_CASE("encode clears the output first") {
    Bytes out{1, 2, 3};
    const uint8_t in[] = {0x13};
    kiss::encode(0x06, in, 1, out);
    CHECK(out == Bytes{0xC0, 0x06, 0x13, 0xC0});
}

TEST_CASE("to_hex renders upper-case space separated bytes") {
    CHECK(kiss::to_hex({}) == "");
    CHECK(kiss::to_hex({0xC0, 0x06, 0x13, 0xC0}) == "C0 06 13 C0");
    CHECK(kiss::to_hex({0x0a}) == "0A");
}
