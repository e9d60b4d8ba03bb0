#ifndef UNO_ROOM_HPP
#define UNO_ROOM_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "Logger.hpp"
#include "Room.hpp"
#include "Uno.hpp"

// Drives one game from the start card to the first empty hand. Only one
// decision is outstanding at any time: a human's send_input blocks the
// whole table.
template <typename Transport>
class UnoRoom :public Room<Transport> {
    std::unique_ptr<Uno> uno_game;
    std::chrono::milliseconds ai_delay_unit;
    std::optional<std::string> winner;

    struct TurnVisitor {
        UnoRoom& room;
        std::vector<Uno::Card>& hand;

        std::optional<Uno::Card> operator()(const Uno::Human& human) {
            return room.human_turn(human, hand);
        }
        std::optional<Uno::Card> operator()(const Uno::Ai& ai) {
            return room.ai_turn(ai, hand);
        }
    };

public:
    UnoRoom(
        Transport& transport,
        const std::vector<UserInfo>& members,
        int n_ai_players,
        std::mt19937::result_type seed,
        std::chrono::milliseconds ai_delay_unit = std::chrono::seconds(1)
    )
        :Room<Transport>(transport, members), ai_delay_unit(ai_delay_unit) {
        std::vector<Uno::Human> humans;
        humans.reserve(members.size());
        for (auto& user : members)
            humans.push_back(Uno::Human{ user.conn_id, user.user_name });
        uno_game = std::make_unique<Uno>(humans, n_ai_players, seed);
    }

    Uno& game() {
        return *uno_game;
    }

    const std::optional<std::string>& get_winner() const {
        return winner;
    }

    std::string run() {
        logging::elog().write(websocketpp::log::elevel::info,
            "Starting a game with " + std::to_string(this->get_num_of_people()) + " human and " +
            std::to_string(uno_game->players.size() - this->get_num_of_people()) + " AI players");
        this->broadcast("Start Card: " + Uno::to_string(uno_game->get_last_card()));

        while (!play_turn());
        return *winner;
    }

    // One pass of the loop: a skip, a draw, or a play with its effects.
    // Returns the winner once somebody has emptied their hand.
    std::optional<std::string> play_turn() {
        if (winner)
            return winner;

        auto& player = uno_game->current_player();
        const std::string name = Uno::user_name(player);

        if (uno_game->take_skip()) {
            this->broadcast(name + " was skipped");
            uno_game->advance();
            return std::nullopt;
        }

        std::optional<Uno::Card> card = std::visit(TurnVisitor{ *this, player.hand }, player.who);

        if (!card) {
            if (uno_game->draw_one())
                this->broadcast(name + " drew a card");
            else
                this->broadcast(name + " could not draw, there are no cards left");
            uno_game->advance();
            return std::nullopt;
        }

        if (player.hand.empty()) {
            uno_game->finish(*card);
            winner = name;
            this->broadcast(name + " won!");
            logging::elog().write(websocketpp::log::elevel::info, "Game over, " + name + " won");
            return winner;
        }

        // resolve() may reverse the play order, `player` is stale after it
        auto effects = uno_game->resolve(*card);
        this->broadcast(name + " played " + Uno::to_string(*card));
        if (effects.drawn)
            this->broadcast(
                Uno::user_name(uno_game->players[effects.target]) +
                " drew " + std::to_string(effects.drawn) + " cards"
            );

        uno_game->advance();
        return std::nullopt;
    }

    static bool is_draw_request(const std::string& text) {
        std::string upper = text;
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper == "DRAW";
    }

    static bool is_index(const std::string& text) {
        return !text.empty() && std::all_of(text.begin(), text.end(),
            [](char c) { return c >= '0' && c <= '9'; });
    }

    // 1-based and wrapping: "0" is the last card, len+1 is the first again.
    // Reduced digit by digit so any length of number works.
    static std::size_t wrap_index(const std::string& digits, std::size_t size) {
        std::size_t k = 0;
        for (char c : digits)
            k = (k * 10 + static_cast<std::size_t>(c - '0')) % size;
        return (k + size - 1) % size;
    }

private:
    std::optional<Uno::Card> human_turn(const Uno::Human& human, std::vector<Uno::Card>& hand) {
        const Uno::Card top = uno_game->get_last_card();
        this->broadcast("It's " + human.user_name + "'s turn! Current card is " + Uno::to_string(top));
        this->send_user(human.conn_id, "It's your turn! " + Uno::to_string(hand));

        while (true) {
            std::string dec = this->send_input(human.conn_id, "Select your card: ");

            if (is_draw_request(dec))
                return std::nullopt;

            if (!is_index(dec)) {
                this->send_user(human.conn_id, "That isn't a valid index! Send a number!");
                continue;
            }

            std::size_t idx = wrap_index(dec, hand.size());
            if (!Uno::can_play(hand[idx], top)) {
                this->send_user(human.conn_id,
                    "You cannot play " + Uno::to_string(hand[idx]) + " on a " + Uno::to_string(top) + ", try again!");
                continue;
            }

            Uno::Card card = uno_game->pick(idx);
            if (hand.empty())
                return card;
            if (Uno::is_wild(card))
                card.color = choose_color(human);
            return card;
        }
    }

    Uno::CardColor choose_color(const Uno::Human& human) {
        while (true) {
            auto color = Uno::parse_color(
                this->send_input(human.conn_id, "Select a color (RED, YELLOW, GREEN, BLUE): "));
            if (color)
                return *color;
            this->send_user(human.conn_id, "That color is invalid! Try again");
        }
    }

    std::optional<Uno::Card> ai_turn(const Uno::Ai& ai, std::vector<Uno::Card>& hand) {
        this->broadcast("It's " + ai.user_name + "'s turn!");
        std::this_thread::sleep_for(ai_delay_unit * uno_game->think_time());

        auto choices = uno_game->legal_choices(hand);
        auto idx = uno_game->ai_choose(choices);
        logging::elog().write(websocketpp::log::elevel::devel,
            ai.user_name + " can play " + std::to_string(choices.size()) +
            " of " + std::to_string(hand.size()) + " cards");
        if (!idx) {
            logging::elog().write(websocketpp::log::elevel::devel,
                ai.user_name + " has nothing to play on " + Uno::to_string(uno_game->get_last_card()));
            return std::nullopt;
        }

        Uno::Card card = uno_game->pick(*idx);
        if (Uno::is_wild(card)) {
            card.color = uno_game->ai_color(hand);
            logging::elog().write(websocketpp::log::elevel::devel,
                ai.user_name + " names " + Uno::to_string(card.color));
        }
        return card;
    }
};

#endif
