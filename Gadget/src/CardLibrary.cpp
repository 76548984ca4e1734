#include "CardLibrary.hpp"

CardLibrary::CardLibrary() {}
CardLibrary::~CardLibrary() { unload(); }

bool CardLibrary::load(const QString& path, QString* err){
    unload();
    lib_.setFileName(path);
    if (!lib_.load()){
        if (err) *err = "Не удалось загрузить библиотеку карты: " + lib_.errorString();
        return false;
    }
    create_  = reinterpret_cast<CreateFn>(lib_.resolve("create_card"));
    destroy_ = reinterpret_cast<DestroyFn>(lib_.resolve("destroy_card"));
    ver_     = reinterpret_cast<VerFn>(lib_.resolve("card_library_version"));
    if (!create_ || !destroy_ || !ver_) {
        if (err) *err = "В библиотеке отсутствуют необходимые точки входа (create_card/destroy_card/card_library_version)";
        unload();
        return false;
    }
    card_ = create_();
    if (!card_) {
        if (err) *err = "create_card() вернула null";
        unload();
        return false;
    }
    return true;
}

// Карта должна быть уже извлечена из слота.
void CardLibrary::unload(){
    if (card_) {
        destroy_(card_);
        card_ = nullptr;
    }
    if (lib_.isLoaded()) lib_.unload();
    create_ = nullptr;
    destroy_ = nullptr;
    ver_ = nullptr;
}
