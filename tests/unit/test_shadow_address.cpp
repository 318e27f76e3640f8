#include "cmux/isolation/ShadowAddress.h"
#include "cmux/common/Logger.h"

#include <cassert>
#include <cstring>
#include <set>
#include <string>

using namespace cmux::isolation;

void testFnvVectors() {
    assert(Fnv1a32("", 0) == 0x811C9DC5u);
    assert(Fnv1a32("a", 1) == 0xE40C292Cu);
    assert(Fnv1a32("foobar", 6) == 0xBF9CF968u);
    LOG_INFO << "FNV-1a vectors PASS";
}

void testKnownAddresses() {
    assert(ShadowAddressString("a") == "127.12.41.44");
    assert(ShadowAddressString("foobar") == "127.156.249.104");
    assert(ShadowAddressString("alpha") == "127.139.109.171");
    assert(ShadowAddressString("beta") == "127.129.228.199");
    assert(ShadowAddressString("feature-x") == "127.110.247.88");
    // Same name, same address.
    assert(ShadowAddress("main") == ShadowAddress(std::string("main")));
    LOG_INFO << "Known addresses PASS";
}

void testPerturbation() {
    // Hashes whose raw bytes would land on 127.0.x.x, x.x.x.0 and x.x.x.255.
    assert(ShadowAddressString("w5970") == "127.1.102.63");
    assert(ShadowAddressString("w6") == "127.71.45.1");
    assert(ShadowAddressString("w443") == "127.63.98.254");
    LOG_INFO << "Perturbation PASS";
}

void testNeverDefaultLoopback() {
    for (int i = 0; i < 50000; ++i) {
        const std::string name = "workspace-" + std::to_string(i);
        const uint32_t ip = ShadowAddress(name);
        assert((ip >> 24) == 127);
        assert(((ip >> 16) & 0xFF) != 0);
        assert((ip & 0xFF) != 0 && (ip & 0xFF) != 255);
        assert(ip != kLoopbackHostOrder);
    }
    LOG_INFO << "Never 127.0.x.x PASS";
}

void testEmptyName() {
    assert(ShadowAddress("", 0) == 0);
    assert(ShadowAddress(nullptr, 0) == 0);
    assert(ShadowAddressString("").empty());
    LOG_INFO << "Empty name PASS";
}

void testCaseAndBytesMatter() {
    assert(ShadowAddress("Alpha") != ShadowAddress("alpha"));
    const char withNul[] = {'a', '\0', 'b'};
    assert(ShadowAddress(withNul, sizeof withNul) != ShadowAddress("a", 1));
    LOG_INFO << "Exact bytes PASS";
}

void testFormat() {
    char buf[kShadowAddressStrLen];
    assert(FormatShadowAddress(0xFFFFFFFFu, buf, sizeof buf));
    assert(std::strcmp(buf, "255.255.255.255") == 0);
    assert(FormatShadowAddress(kLoopbackHostOrder, buf, sizeof buf));
    assert(std::strcmp(buf, "127.0.0.1") == 0);

    char small[9];
    assert(!FormatShadowAddress(kLoopbackHostOrder, small, sizeof small));
    char exact[10];
    assert(FormatShadowAddress(kLoopbackHostOrder, exact, sizeof exact));
    LOG_INFO << "Format PASS";
}

void testSpread() {
    std::set<uint32_t> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(ShadowAddress("ws" + std::to_string(i)));
    }
    // 24 bits of hash for 1000 names: collisions are possible but rare.
    assert(seen.size() >= 990);
    LOG_INFO << "Spread PASS";
}

int main() {
    testFnvVectors();
    testKnownAddresses();
    testPerturbation();
    testNeverDefaultLoopback();
    testEmptyName();
    testCaseAndBytesMatter();
    testFormat();
    testSpread();
    return 0;
}
