#include "GadgetApi.h"
#include "SoftCard.h"

using namespace ccidgadget;

extern "C" {

CCIDGADGET_API ICard* create_card() {
    try { return new SoftCard(); }
    catch (const std::exception&) { return nullptr; }
}

CCIDGADGET_API void destroy_card(ICard* p) {
    delete p;
}

CCIDGADGET_API const char* card_library_version() {
    return "softcard 0.1";
}

}
