#ifndef UNO_HPP
#define UNO_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "Errors.hpp"

class Uno {
public:
    enum CardRank {
        // numbers
        ZERO, ONE, TWO, THREE, FOUR, FIVE, SIX, SEVEN, EIGHT, NINE,

        // functions
        SKIP, REVERSE, DRAW_2,

        // wild
        WILD, WILD_DRAW_4
    };
    enum CardColor {
        RED, BLUE, GREEN, YELLOW,
        ALL
    };
    struct Card {
        CardRank rank;
        CardColor color;

        bool operator==(Card another) const {
            return rank == another.rank &&
                color == another.color;
        }
        bool operator!=(Card another) const {
            return !(*this == another);
        }
    };

    struct Human {
        unsigned conn_id;
        std::string user_name;
    };
    struct Ai {
        std::string user_name;
    };
    struct Player {
        std::variant<Human, Ai> who;
        std::vector<Card> hand;
        bool skipped = false;
    };

    struct Effects {
        int drawn = 0;              // cards actually forced onto the next player
        std::size_t target = 0;     // index of that player in the play order
        bool reversed = false;
        bool skipped = false;
    };

    static constexpr int hand_size = 7;
    static constexpr CardColor playable_colors[] = { RED, BLUE, GREEN, YELLOW };

private:
    std::mt19937 rng;
    std::vector<Card> deck;
    std::vector<Card> played;
    std::vector<Player> players_;
    std::size_t current = 0;

public:
    const std::vector<Player>& players = players_;

public:
    Uno(const std::vector<Human>& humans, int n_ai_players, std::mt19937::result_type seed)
        :rng(seed) {
        check_player_count(humans.size(), n_ai_players);

        deck = generate_deck(rng);
        players_.reserve(humans.size() + n_ai_players);
        for (auto& human : humans)
            players_.push_back(Player{ human, generate_hand(deck) });
        for (int i = 0; i < n_ai_players; ++i)
            players_.push_back(Player{ Ai{ "Player " + std::to_string(i) }, generate_hand(deck) });

        played.push_back(deck.back());
        deck.pop_back();
    }

    // 0-9 once per color for zero, twice for the rest, two color cycles of
    // each action card, four of each wild
    static const std::vector<Card>& all_cards() {
        static const std::vector<Card> cards = [] {
            std::vector<Card> cards;
            cards.reserve(108);
            for (auto color : playable_colors)
                cards.push_back(Card{ ZERO, color });
            for (int cycle = 0; cycle < 2; ++cycle)
                for (auto color : playable_colors)
                    for (int n = ONE; n <= NINE; ++n)
                        cards.push_back(Card{ static_cast<CardRank>(n), color });
            for (int cycle = 0; cycle < 2; ++cycle)
                for (auto color : playable_colors) {
                    cards.push_back(Card{ SKIP, color });
                    cards.push_back(Card{ REVERSE, color });
                    cards.push_back(Card{ DRAW_2, color });
                }
            for (int i = 0; i < 4; ++i) {
                cards.push_back(Card{ WILD, ALL });
                cards.push_back(Card{ WILD_DRAW_4, ALL });
            }
            return cards;
        }();
        return cards;
    }

    static std::vector<Card> generate_deck(std::mt19937& rng) {
        std::vector<Card> deck = all_cards();
        std::shuffle(deck.begin(), deck.end(), rng);
        return deck;
    }

    // Caller guarantees the deck holds at least n cards
    static std::vector<Card> generate_hand(std::vector<Card>& deck, int n = hand_size) {
        std::vector<Card> hand;
        hand.reserve(n);
        for (int i = 0; i < n; ++i) {
            hand.push_back(deck.back());
            deck.pop_back();
        }
        return hand;
    }

    // An empty deck is refilled from everything but the top of the
    // discard pile. Wilds go back uncolored. Nothing is drawn once every
    // card but the top one sits in a hand.
    static std::optional<Card> draw_card(std::vector<Card>& deck, std::vector<Card>& played, std::mt19937& rng) {
        if (deck.empty()) {
            if (played.empty())
                throw std::logic_error("draw_card: the discard pile is empty");
            if (played.size() == 1)
                return std::nullopt;
            Card top = played.back();
            played.pop_back();
            for (auto& card : played)
                if (is_wild(card))
                    card.color = ALL;
            std::shuffle(played.begin(), played.end(), rng);
            deck.insert(deck.end(), played.begin(), played.end());
            played.clear();
            played.push_back(top);
        }
        Card card = deck.back();
        deck.pop_back();
        return card;
    }

    static void check_player_count(std::size_t n_humans, int n_ai_players) {
        if (n_ai_players < 0)
            throw ConfigurationError("the number of AI players must be a non-negative integer");
        std::size_t total = n_humans + static_cast<std::size_t>(n_ai_players);
        if (total == 0)
            throw ConfigurationError("cannot start a game without players");
        if (all_cards().size() / total < static_cast<std::size_t>(hand_size))
            throw ConfigurationError("cannot start a game with " + std::to_string(total) +
                " players, there are not enough cards for full hands");
    }

    static bool is_wild(Card card) {
        return card.rank == WILD || card.rank == WILD_DRAW_4;
    }

    static int draw_count(Card card) {
        switch (card.rank) {
        case DRAW_2: return 2;
        case WILD_DRAW_4: return 4;
        default: return 0;
        }
    }

    static bool can_play(Card card, Card top) {
        return is_wild(card) || card.rank == top.rank || card.color == top.color;
    }

    static std::string to_string(CardRank rank) {
        static const char* names[] = {
            "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
            "SKIP", "REVERSE", "DRAW2", "WILD", "WILD4"
        };
        return names[rank];
    }
    static std::string to_string(CardColor color) {
        static const char* names[] = { "RED", "BLUE", "GREEN", "YELLOW", "ALL" };
        return names[color];
    }
    static std::string to_string(Card card) {
        return to_string(card.rank) + " " + to_string(card.color);
    }
    static std::string to_string(const std::vector<Card>& hand) {
        std::string res;
        for (std::size_t i = 0; i < hand.size(); ++i) {
            if (i) res += ", ";
            res += to_string(hand[i]);
        }
        return res;
    }

    // Case-insensitive; ALL is not a color a player may choose
    static std::optional<CardColor> parse_color(const std::string& text) {
        std::string upper = text;
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (auto color : playable_colors)
            if (upper == to_string(color))
                return color;
        return std::nullopt;
    }

    static const std::string& user_name(const Player& player) {
        return std::visit([](const auto& who) -> const std::string& { return who.user_name; }, player.who);
    }

public:
    Card get_last_card() const {
        if (played.empty())
            throw std::logic_error("the discard pile is empty");
        return played.back();
    }
    std::size_t get_current_index() const {
        return current;
    }
    Player& current_player() {
        return players_[current];
    }
    std::size_t next_index() const {
        return (current + 1) % players_.size();
    }

    std::vector<Card>& draw_pile() {
        return deck;
    }
    std::vector<Card>& discard_pile() {
        return played;
    }
    std::vector<Card>& hand_of(std::size_t idx) {
        return players_[idx].hand;
    }

    void advance() {
        current = next_index();
    }

    // Clears and reports the current player's skip-pending flag
    bool take_skip() {
        auto& player = current_player();
        if (!player.skipped)
            return false;
        player.skipped = false;
        return true;
    }

    Card pick(std::size_t idx) {
        auto& hand = current_player().hand;
        Card card = hand.at(idx);
        hand.erase(hand.begin() + idx);
        return card;
    }

    std::optional<Card> draw_one() {
        auto card = draw_card(deck, played, rng);
        if (card)
            current_player().hand.push_back(*card);
        return card;
    }

    // The winning card still goes on the discard pile, without effects
    void finish(Card card) {
        played.push_back(card);
    }

    Effects resolve(Card card) {
        Effects effects;
        played.push_back(card);

        if (card.rank == REVERSE) {
            std::reverse(players_.begin(), players_.end());
            effects.reversed = true;
        }

        else if (card.rank == SKIP) {
            players_[next_index()].skipped = true;
            effects.skipped = true;
        }

        int n = draw_count(card);
        if (n) {
            effects.target = next_index();
            auto& hand = players_[effects.target].hand;
            for (int i = 0; i < n; ++i) {
                auto drawn = draw_card(deck, played, rng);
                if (!drawn)
                    break;
                hand.push_back(*drawn);
                ++effects.drawn;
            }
        }
        return effects;
    }

    std::vector<std::size_t> legal_choices(const std::vector<Card>& hand) const {
        std::vector<std::size_t> choices;
        for (std::size_t i = 0; i < hand.size(); ++i)
            if (can_play(hand[i], get_last_card()))
                choices.push_back(i);
        return choices;
    }

    std::optional<std::size_t> ai_choose(const std::vector<std::size_t>& choices) {
        if (choices.empty())
            return std::nullopt;
        std::uniform_int_distribution<std::size_t> dist(0, choices.size() - 1);
        return choices[dist(rng)];
    }

    // The color the hand holds most of, first one seen on a tie
    CardColor ai_color(const std::vector<Card>& hand) {
        std::vector<std::pair<CardColor, int>> counts;
        for (auto& card : hand) {
            if (card.color == ALL)
                continue;
            auto it = std::find_if(counts.begin(), counts.end(),
                [&card](const std::pair<CardColor, int>& c) { return c.first == card.color; });
            if (it == counts.end())
                counts.emplace_back(card.color, 1);
            else
                ++it->second;
        }
        if (counts.empty()) {
            std::uniform_int_distribution<int> dist(0, 3);
            return playable_colors[dist(rng)];
        }
        auto best = counts.begin();
        for (auto it = counts.begin(); it != counts.end(); ++it)
            if (it->second > best->second)
                best = it;
        return best->first;
    }

    int think_time() {
        std::uniform_int_distribution<int> dist(1, 4);
        return dist(rng);
    }

};

#endif
