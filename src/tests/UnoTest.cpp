#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <utility>
#include <vector>

#include "../Uno.hpp"

namespace
{
using Card = Uno::Card;

auto card_key(Card c) -> std::pair<int, int>
{
    // a chosen wild color does not change which physical card it is
    return { c.rank, Uno::is_wild(c) ? static_cast<int>(Uno::ALL) : static_cast<int>(c.color) };
}

auto multiset_of(std::vector<Card> const& cards) -> std::map<std::pair<int, int>, int>
{
    std::map<std::pair<int, int>, int> counts;
    for (auto c : cards)
    {
        ++counts[card_key(c)];
    }
    return counts;
}

auto everything_in(Uno& g) -> std::vector<Card>
{
    std::vector<Card> all = g.draw_pile();
    all.insert(all.end(), g.discard_pile().begin(), g.discard_pile().end());
    for (auto const& p : g.players)
    {
        all.insert(all.end(), p.hand.begin(), p.hand.end());
    }
    return all;
}

auto make_game(int n_ai, std::mt19937::result_type seed) -> Uno
{
    return Uno({ Uno::Human{ 1, "Henry" } }, n_ai, seed);
}
}

TEST(UnoDeck, CanonicalCompositionHas108Cards)
{
    auto const& cards = Uno::all_cards();
    ASSERT_EQ(cards.size(), 108u);

    std::map<std::pair<int, int>, int> counts = multiset_of(cards);
    for (auto color : Uno::playable_colors)
    {
        EXPECT_EQ((counts[{ Uno::ZERO, color }]), 1);
        for (int n = Uno::ONE; n <= Uno::NINE; ++n)
        {
            EXPECT_EQ((counts[{ n, color }]), 2);
        }
        EXPECT_EQ((counts[{ Uno::SKIP, color }]), 2);
        EXPECT_EQ((counts[{ Uno::REVERSE, color }]), 2);
        EXPECT_EQ((counts[{ Uno::DRAW_2, color }]), 2);
    }
    EXPECT_EQ((counts[{ Uno::WILD, Uno::ALL }]), 4);
    EXPECT_EQ((counts[{ Uno::WILD_DRAW_4, Uno::ALL }]), 4);
}

TEST(UnoDeck, GeneratedDecksShareTheMultisetButNotTheOrder)
{
    std::mt19937 rng(7);
    auto a = Uno::generate_deck(rng);
    auto b = Uno::generate_deck(rng);

    EXPECT_EQ(multiset_of(a), multiset_of(Uno::all_cards()));
    EXPECT_EQ(multiset_of(b), multiset_of(Uno::all_cards()));
    EXPECT_NE(a, b);
}

TEST(UnoDeck, GenerateHandTakesFromTheTail)
{
    std::mt19937 rng(3);
    auto deck = Uno::generate_deck(rng);
    std::vector<Card> tail(deck.end() - 7, deck.end());

    auto hand = Uno::generate_hand(deck);

    ASSERT_EQ(hand.size(), 7u);
    EXPECT_EQ(deck.size(), 101u);
    std::reverse(tail.begin(), tail.end());
    EXPECT_EQ(hand, tail);
}

TEST(UnoDeck, DrawCardPopsFromTheDeckWhenItHasCards)
{
    std::mt19937 rng(1);
    std::vector<Card> deck{ { Uno::ONE, Uno::RED }, { Uno::TWO, Uno::BLUE } };
    std::vector<Card> played{ { Uno::NINE, Uno::GREEN } };

    auto c = Uno::draw_card(deck, played, rng);

    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, (Card{ Uno::TWO, Uno::BLUE }));
    EXPECT_EQ(deck.size(), 1u);
    EXPECT_EQ(played.size(), 1u);
}

TEST(UnoDeck, EmptyDeckIsRefilledFromTheDiscardPileMinusItsTop)
{
    std::mt19937 rng(11);
    std::vector<Card> deck;
    std::vector<Card> played{
        { Uno::ONE, Uno::RED },
        { Uno::WILD, Uno::BLUE },
        { Uno::SKIP, Uno::GREEN },
        { Uno::FIVE, Uno::YELLOW },
    };
    auto const before = multiset_of(played);

    auto drawn = Uno::draw_card(deck, played, rng);

    ASSERT_TRUE(drawn.has_value());
    ASSERT_EQ(played.size(), 1u);
    EXPECT_EQ(played.back(), (Card{ Uno::FIVE, Uno::YELLOW }));
    EXPECT_EQ(deck.size(), 2u);

    std::vector<Card> after = deck;
    after.push_back(*drawn);
    after.push_back(played.back());
    EXPECT_EQ(multiset_of(after), before);

    // the recycled wild lost its chosen color
    for (auto c : after)
    {
        if (c.rank == Uno::WILD)
        {
            EXPECT_EQ(c.color, Uno::ALL);
        }
    }
}

TEST(UnoDeck, TopOfTheDiscardPileIsNeverDrawn)
{
    std::mt19937 rng(5);
    std::vector<Card> deck;
    std::vector<Card> played{ { Uno::WILD_DRAW_4, Uno::RED } };

    EXPECT_FALSE(Uno::draw_card(deck, played, rng).has_value());
    ASSERT_EQ(played.size(), 1u);
    EXPECT_EQ(played.back(), (Card{ Uno::WILD_DRAW_4, Uno::RED }));
    EXPECT_TRUE(deck.empty());
}

TEST(UnoEffects, ForcedDrawStopsWhenNothingIsLeftToDraw)
{
    Uno g = make_game(1, 8);
    g.draw_pile() = { { Uno::ONE, Uno::RED } };
    g.discard_pile() = { { Uno::THREE, Uno::RED } };

    auto effects = g.resolve({ Uno::DRAW_2, Uno::RED });

    // the recycled 3 RED and the 1 RED, nothing more
    EXPECT_EQ(effects.drawn, 2);
    EXPECT_EQ(g.players[1].hand.size(), 9u);

    g.advance();
    effects = g.resolve({ Uno::WILD_DRAW_4, Uno::GREEN });
    EXPECT_EQ(effects.drawn, 1);
    EXPECT_EQ(g.players[0].hand.size(), 8u);
    ASSERT_EQ(g.discard_pile().size(), 1u);
    EXPECT_EQ(g.get_last_card(), (Card{ Uno::WILD_DRAW_4, Uno::GREEN }));
    EXPECT_TRUE(g.draw_pile().empty());
}

TEST(UnoRules, LegalPlayMatchesRankOrColorOrIsWild)
{
    Card top{ Uno::SEVEN, Uno::RED };
    EXPECT_TRUE(Uno::can_play({ Uno::SEVEN, Uno::BLUE }, top));
    EXPECT_TRUE(Uno::can_play({ Uno::TWO, Uno::RED }, top));
    EXPECT_TRUE(Uno::can_play({ Uno::WILD, Uno::ALL }, top));
    EXPECT_TRUE(Uno::can_play({ Uno::WILD_DRAW_4, Uno::ALL }, top));
    EXPECT_FALSE(Uno::can_play({ Uno::TWO, Uno::BLUE }, top));
    EXPECT_FALSE(Uno::can_play({ Uno::SKIP, Uno::GREEN }, top));

    // an uncolored wild on top only takes another wild
    Card wild_top{ Uno::WILD, Uno::ALL };
    EXPECT_FALSE(Uno::can_play({ Uno::ONE, Uno::RED }, wild_top));
    EXPECT_TRUE(Uno::can_play({ Uno::WILD_DRAW_4, Uno::ALL }, wild_top));
}

TEST(UnoRules, DrawCountComesFromTheRank)
{
    EXPECT_EQ(Uno::draw_count({ Uno::DRAW_2, Uno::RED }), 2);
    EXPECT_EQ(Uno::draw_count({ Uno::WILD_DRAW_4, Uno::GREEN }), 4);
    EXPECT_EQ(Uno::draw_count({ Uno::WILD, Uno::GREEN }), 0);
    EXPECT_EQ(Uno::draw_count({ Uno::NINE, Uno::GREEN }), 0);
}

TEST(UnoRules, CardsPrintAsRankThenColor)
{
    EXPECT_EQ(Uno::to_string(Card{ Uno::DRAW_2, Uno::YELLOW }), "DRAW2 YELLOW");
    EXPECT_EQ(Uno::to_string(Card{ Uno::WILD_DRAW_4, Uno::ALL }), "WILD4 ALL");
    EXPECT_EQ(Uno::to_string(std::vector<Card>{ { Uno::ZERO, Uno::RED }, { Uno::WILD, Uno::ALL } }), "0 RED, WILD ALL");
}

TEST(UnoRules, ParseColorIsCaseInsensitiveAndRejectsAll)
{
    EXPECT_EQ(Uno::parse_color("green"), Uno::GREEN);
    EXPECT_EQ(Uno::parse_color("YeLLoW"), Uno::YELLOW);
    EXPECT_FALSE(Uno::parse_color("ALL").has_value());
    EXPECT_FALSE(Uno::parse_color("purple").has_value());
}

TEST(UnoSetup, PlayerCountIsCheckedAgainstTheDeck)
{
    EXPECT_NO_THROW(Uno::check_player_count(1, 5));     // 108 / 6 = 18
    EXPECT_NO_THROW(Uno::check_player_count(10, 5));    // 108 / 15 = 7
    EXPECT_THROW(Uno::check_player_count(11, 5), ConfigurationError);
    EXPECT_THROW(Uno::check_player_count(1, -1), ConfigurationError);
    EXPECT_THROW(Uno::check_player_count(0, 0), ConfigurationError);
}

TEST(UnoSetup, DealsSevenEachAndFlipsAStartCard)
{
    Uno g = make_game(5, 42);

    ASSERT_EQ(g.players.size(), 6u);
    for (auto const& p : g.players)
    {
        EXPECT_EQ(p.hand.size(), 7u);
    }
    EXPECT_EQ(Uno::user_name(g.players[0]), "Henry");
    EXPECT_EQ(Uno::user_name(g.players[1]), "Player 0");
    EXPECT_EQ(Uno::user_name(g.players[5]), "Player 4");
    EXPECT_EQ(g.discard_pile().size(), 1u);
    EXPECT_EQ(g.draw_pile().size(), 108u - 42u - 1u);
    EXPECT_EQ(multiset_of(everything_in(g)), multiset_of(Uno::all_cards()));
}

TEST(UnoSetup, SameSeedSameGame)
{
    Uno a = make_game(3, 99);
    Uno b = make_game(3, 99);
    EXPECT_EQ(a.draw_pile(), b.draw_pile());
    EXPECT_EQ(a.get_last_card(), b.get_last_card());
}

TEST(UnoEffects, DrawTwoAndWildFourLandOnTheNextPlayer)
{
    Uno g = make_game(2, 8);
    g.discard_pile() = { { Uno::THREE, Uno::RED } };
    auto const total = everything_in(g).size();

    auto effects = g.resolve({ Uno::DRAW_2, Uno::RED });
    EXPECT_EQ(effects.drawn, 2);
    EXPECT_EQ(effects.target, 1u);
    EXPECT_EQ(g.players[1].hand.size(), 9u);
    EXPECT_EQ(g.get_last_card(), (Card{ Uno::DRAW_2, Uno::RED }));

    g.advance();
    effects = g.resolve({ Uno::WILD_DRAW_4, Uno::BLUE });
    EXPECT_EQ(effects.drawn, 4);
    EXPECT_EQ(effects.target, 2u);
    EXPECT_EQ(g.players[2].hand.size(), 11u);

    // the two played cards came from nowhere in this test
    EXPECT_EQ(everything_in(g).size(), total + 2);
}

TEST(UnoEffects, ReverseFlipsThePlayOrderInPlace)
{
    Uno g = make_game(2, 8);
    g.resolve({ Uno::REVERSE, Uno::RED });

    EXPECT_EQ(Uno::user_name(g.players[0]), "Player 1");
    EXPECT_EQ(Uno::user_name(g.players[1]), "Player 0");
    EXPECT_EQ(Uno::user_name(g.players[2]), "Henry");
    EXPECT_EQ(g.get_current_index(), 0u);
}

TEST(UnoEffects, SkipMarksTheNextPlayerWithWraparound)
{
    Uno g = make_game(2, 8);
    g.advance();
    g.advance();    // last in the order
    g.resolve({ Uno::SKIP, Uno::RED });

    EXPECT_TRUE(g.players[0].skipped);
    g.advance();
    EXPECT_TRUE(g.take_skip());
    EXPECT_FALSE(g.take_skip());
}

TEST(UnoAi, ChoosesOnlyLegalCards)
{
    Uno g = make_game(1, 17);
    g.discard_pile() = { { Uno::FOUR, Uno::GREEN } };
    std::vector<Card> hand{ { Uno::ONE, Uno::RED }, { Uno::FOUR, Uno::BLUE }, { Uno::TWO, Uno::YELLOW } };

    for (int i = 0; i < 20; ++i)
    {
        auto idx = g.ai_choose(g.legal_choices(hand));
        ASSERT_TRUE(idx.has_value());
        EXPECT_EQ(*idx, 1u);
    }

    std::vector<Card> nothing{ { Uno::ONE, Uno::RED } };
    EXPECT_TRUE(g.legal_choices(nothing).empty());
    EXPECT_FALSE(g.ai_choose(g.legal_choices(nothing)).has_value());
}

TEST(UnoAi, NamesItsMostCommonColorFirstSeenOnATie)
{
    Uno g = make_game(1, 17);
    EXPECT_EQ(g.ai_color({ { Uno::ONE, Uno::BLUE }, { Uno::TWO, Uno::RED }, { Uno::THREE, Uno::RED } }), Uno::RED);
    EXPECT_EQ(g.ai_color({ { Uno::ONE, Uno::GREEN }, { Uno::TWO, Uno::RED } }), Uno::GREEN);
    // uncolored wilds are not a choice
    EXPECT_EQ(g.ai_color({ { Uno::WILD, Uno::ALL }, { Uno::WILD, Uno::ALL }, { Uno::TWO, Uno::YELLOW } }), Uno::YELLOW);

    auto fallback = g.ai_color({});
    EXPECT_NE(fallback, Uno::ALL);
}

TEST(UnoAi, ThinkTimeStaysWithinOneToFour)
{
    Uno g = make_game(1, 23);
    for (int i = 0; i < 100; ++i)
    {
        int t = g.think_time();
        EXPECT_GE(t, 1);
        EXPECT_LE(t, 4);
    }
}
