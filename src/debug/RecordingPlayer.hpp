//
// Created by Malik T on 10/10/2025.
//

#ifndef MATHHIGHLOW_RECORDINGPLAYER_HPP
#define MATHHIGHLOW_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace mhl::core::debug
{
    // Wraps a player and keeps every snapshot it was shown and expression it returned.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<const RoundSnapshot> s) -> Expression override
        {
            seen_.push_back(s);
            played_.push_back(inner_->Play(std::move(s)));
            return played_.back();
        }

        auto HasLast() const -> bool { return !played_.empty(); }
        auto Last() const -> Expression const& { return played_.back(); }
        auto LastSnapshot() const -> RoundSnapshot const& { return *seen_.back(); }
        auto Rounds() const -> size_t { return played_.size(); }

        auto Inner() const -> Player* { return inner_.get(); }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<std::shared_ptr<const RoundSnapshot>> seen_;
        std::vector<Expression> played_;
    };

    // Downcast helper (only safe if the seat was wrapped at construction)
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
} // namespace mhl::core::debug

#endif //MATHHIGHLOW_RECORDINGPLAYER_HPP
