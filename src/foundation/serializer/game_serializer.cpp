/// @file game_serializer.cpp
/// @brief Non-template parts of GameSerializer.

#include "mf/foundation/game_serializer.hpp"

namespace mf::foundation {

struct GameSerializer::Impl {};

GameSerializer::GameSerializer() : impl_(std::make_unique<Impl>()) {}

GameSerializer::~GameSerializer() = default;

GameSerializer::GameSerializer(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::operator=(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::instance() {
    static GameSerializer inst;
    return inst;
}

}  // namespace mf::foundation
