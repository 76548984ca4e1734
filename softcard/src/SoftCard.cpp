#include "SoftCard.h"
#include <iterator>

namespace ccidgadget {
namespace {
// TS=3B, T0=DA (TA1 TC1 TD1, 10 исторических байт), TA1=11, TC1=FF,
// TD1=81 (T=1), TD2=B1, TA3=FE (IFSC 254), TB3=55 (BWI 5, CWI 5),
// TD3=1F (T=15), TA4=03 (5В/3В)
constexpr uint8_t ATR_HEAD[] = { 0x3B, 0xDA, 0x11, 0xFF, 0x81, 0xB1, 0xFE, 0x55, 0x1F, 0x03 };
// категория 00, DF name + GET DATA + MF, цепочки команд, 90 00
constexpr uint8_t HISTORICAL[] = { 0x00, 0x31, 0x84, 0x73, 0x80, 0x01, 0x80, 0x00, 0x90, 0x00 };

constexpr uint8_t INS_SELECT        = 0xA4;
constexpr uint8_t INS_GET_CHALLENGE = 0x84;

std::vector<uint8_t> sw(uint16_t s){ return { uint8_t(s>>8), uint8_t(s&0xFF) }; }
}

SoftCard::SoftCard() : rng_(std::random_device{}()) {}

std::vector<uint8_t> SoftCard::defaultATR(){
    std::vector<uint8_t> atr(std::begin(ATR_HEAD), std::end(ATR_HEAD));
    atr.insert(atr.end(), std::begin(HISTORICAL), std::end(HISTORICAL));
    // TCK: XOR всех байт от T0 до последнего исторического (E4)
    uint8_t tck = 0;
    for (size_t i=1;i<atr.size();++i) tck ^= atr[i];
    atr.push_back(tck);
    return atr;
}

bool SoftCard::clearVolatiles(){
    selected_.clear();
    return true;
}

std::vector<uint8_t> SoftCard::getATR(){
    selected_.clear();
    return defaultATR();
}

std::vector<uint8_t> SoftCard::runAPDU(const std::vector<uint8_t>& c){
    if (c.size() < 4) return sw(0x6700);
    if (c[0] == 0xFF) return sw(0x6E00);
    switch (c[1]){
    case INS_SELECT:        return select(c);
    case INS_GET_CHALLENGE: return getChallenge(c);
    default:                return sw(0x6D00);
    }
}

// SELECT: запоминаем имя (AID/FID) как есть, любое считается найденным.
std::vector<uint8_t> SoftCard::select(const std::vector<uint8_t>& c){
    if (c.size() == 4) { selected_.clear(); return sw(0x9000); }
    const size_t lc = c[4];
    if (lc == 0 || c.size() < 5 + lc) return sw(0x6700);
    selected_.assign(c.begin() + 5, c.begin() + 5 + std::ptrdiff_t(lc));
    return sw(0x9000);
}

std::vector<uint8_t> SoftCard::getChallenge(const std::vector<uint8_t>& c){
    if (c.size() > 5) return sw(0x6700);
    size_t le = c.size() == 5 ? c[4] : 8;
    if (le == 0) le = 256;
    std::vector<uint8_t> r; r.reserve(le + 2);
    std::uniform_int_distribution<int> byte(0, 255);
    for (size_t i=0;i<le;++i) r.push_back(uint8_t(byte(rng_)));
    r.push_back(0x90); r.push_back(0x00);
    return r;
}

} // namespace ccidgadget
