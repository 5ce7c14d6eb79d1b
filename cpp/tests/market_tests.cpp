#define BOOST_TEST_MODULE MarketTests
#include <boost/test/unit_test.hpp>

#include <array>
#include <limits>
#include <vector>

#include "market.hpp"
#include "market_runner.hpp"
#include "test_helpers.hpp"

using namespace lmsr;

namespace {

uint64_t price_sum( const Market& m )
{
   uint64_t sum = 0;
   for( size_t i = 0; i < m.num_outcomes; ++i )
      sum += m.price(i);
   return sum;
}

// Each price floors on its own, so N outcomes may lose up to N-1 units.
void check_price_sum( const Market& m )
{
   uint64_t sum = price_sum(m);
   BOOST_CHECK_LE( sum, uint64_t(D9) );
   BOOST_CHECK_GE( sum, uint64_t(D9) - (m.num_outcomes - 1) );
}

} // namespace

BOOST_AUTO_TEST_SUITE( market_construction )

BOOST_AUTO_TEST_CASE( valid_market_starts_empty )
{
   Market m( 3, 1000000000, "rain-tomorrow", 1700000000 );
   BOOST_CHECK_EQUAL( m.num_outcomes, 3 );
   BOOST_CHECK_EQUAL( m.scale, 1000000000u );
   BOOST_CHECK_EQUAL( m.label, "rain-tomorrow" );
   BOOST_CHECK_EQUAL( m.resolve_at, 1700000000 );
   for( size_t i = 0; i < m.num_outcomes; ++i )
   {
      BOOST_CHECK_EQUAL( m.supplies[i], 0u );
      BOOST_CHECK_EQUAL( m.reserves[i], 0u );
   }
}

BOOST_AUTO_TEST_CASE( lifecycle_metadata_is_carried )
{
   std::array<uint8_t, ADMIN_KEY_LENGTH> admin{};
   admin[0] = 0xab;
   admin[ADMIN_KEY_LENGTH - 1] = 0x01;

   Market m( 2, 1000000000, "election", 1800000000, 1700000000, admin );
   BOOST_CHECK_EQUAL( m.initialized_at, 1700000000u );
   BOOST_CHECK_EQUAL( m.resolve_at, 1800000000 );
   BOOST_CHECK( m.admin == admin );

   // metadata never feeds the pricing
   BOOST_CHECK_EQUAL( m.cost(), 693147180u );

   Market plain( 2, 1000000000 );
   BOOST_CHECK_EQUAL( plain.initialized_at, 0u );
   BOOST_CHECK( plain.admin == (std::array<uint8_t, ADMIN_KEY_LENGTH>{}) );
}

BOOST_AUTO_TEST_CASE( outcome_count_bounds )
{
   BOOST_CHECK_EXCEPTION( Market( 0, 1000000000 ), market_error, code_is{errc::not_enough_outcomes} );
   BOOST_CHECK_EXCEPTION( Market( 1, 1000000000 ), market_error, code_is{errc::not_enough_outcomes} );
   BOOST_CHECK_EXCEPTION( Market( MAX_OUTCOMES + 1, 1000000000 ), market_error, code_is{errc::too_many_outcomes} );
   BOOST_CHECK_NO_THROW( Market( MAX_OUTCOMES, 1000000000 ) );
   BOOST_CHECK_NO_THROW( Market( 2, 1000000000 ) );
}

BOOST_AUTO_TEST_CASE( label_length )
{
   BOOST_CHECK_NO_THROW( Market( 2, 1000000000, std::string(MAX_LABEL_LENGTH, 'x') ) );
   BOOST_CHECK_EXCEPTION( Market( 2, 1000000000, std::string(MAX_LABEL_LENGTH + 1, 'x') ),
                          market_error, code_is{errc::invalid_label_length} );
}

BOOST_AUTO_TEST_CASE( zero_scale_is_accepted_until_used )
{
   Market m( 2, 0 );
   BOOST_CHECK_EXCEPTION( m.cost(), market_error, code_is{errc::liquidity_parameter_is_zero} );
   BOOST_CHECK_EXCEPTION( m.price(0), market_error, code_is{errc::liquidity_parameter_is_zero} );
   BOOST_CHECK_EXCEPTION( m.buy_shares(0, 1000), market_error, code_is{errc::liquidity_parameter_is_zero} );
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE( market_quotes )

BOOST_AUTO_TEST_CASE( empty_two_outcome_market )
{
   Market m( 2, 1000000000 );
   BOOST_CHECK_EQUAL( m.cost(), 693147180u );
   BOOST_CHECK_EQUAL( m.price(0), 500000000u );
   BOOST_CHECK_EQUAL( m.price(1), 500000000u );
   BOOST_CHECK_EQUAL( price_sum(m), uint64_t(D9) );
}

BOOST_AUTO_TEST_CASE( empty_three_outcome_market )
{
   Market m( 3, 1000000000 );
   BOOST_CHECK_EQUAL( m.cost(), 1098612290u );
   for( size_t i = 0; i < 3; ++i )
      BOOST_CHECK_EQUAL( m.price(i), 333333333u );
   BOOST_CHECK_EQUAL( price_sum(m), 999999999u );
}

BOOST_AUTO_TEST_CASE( empty_market_at_outcome_bound )
{
   Market m( 16, 1000000000 );
   BOOST_CHECK_EQUAL( m.cost(), 2772588724u );
   for( size_t i = 0; i < 16; ++i )
      BOOST_CHECK_EQUAL( m.price(i), 62500000u );
   BOOST_CHECK_EQUAL( price_sum(m), uint64_t(D9) );
}

BOOST_AUTO_TEST_CASE( out_of_range_index )
{
   Market m( 2, 1000000000 );
   BOOST_CHECK_EXCEPTION( m.price(2), market_error, code_is{errc::invalid_outcome_index} );
   BOOST_CHECK_EXCEPTION( m.price(MAX_OUTCOMES), market_error, code_is{errc::invalid_outcome_index} );
   BOOST_CHECK_EXCEPTION( m.buy_shares(2, 1000), market_error, code_is{errc::invalid_outcome_index} );
}

BOOST_AUTO_TEST_CASE( corrupt_outcome_count )
{
   Market m( 2, 1000000000 );
   m.num_outcomes = static_cast<uint8_t>(MAX_OUTCOMES + 1);
   BOOST_CHECK_EXCEPTION( m.cost(), market_error, code_is{errc::too_many_outcomes} );
   BOOST_CHECK_EXCEPTION( m.price(0), market_error, code_is{errc::too_many_outcomes} );
   BOOST_CHECK_EXCEPTION( m.buy_shares(0, 1000), market_error, code_is{errc::too_many_outcomes} );
}

BOOST_AUTO_TEST_CASE( saturated_exponent_overflows_quotes )
{
   Market m( 2, 1000000000 );
   m.supplies[0] = 25000000000;
   BOOST_CHECK_EXCEPTION( m.cost(), market_error, code_is{errc::math_overflow} );
   BOOST_CHECK_EXCEPTION( m.price(1), market_error, code_is{errc::math_overflow} );
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE( market_trading )

BOOST_AUTO_TEST_CASE( two_outcome_sequence )
{
   Market m( 2, 1000000000 );

   BOOST_CHECK_EQUAL( m.buy_shares(0, 500000000), 1000000000u );
   BOOST_CHECK_EQUAL( m.supplies[0], 1000000000u );
   BOOST_CHECK_EQUAL( m.reserves[0], 500000000u );
   BOOST_CHECK_EQUAL( m.cost(), 1313261688u );
   BOOST_CHECK_EQUAL( m.price(0), 731058578u );
   BOOST_CHECK_EQUAL( m.price(1), 268941421u );

   BOOST_CHECK_EQUAL( m.buy_shares(1, 800000000), 4000000000u );
   BOOST_CHECK_EQUAL( m.cost(), 4048587350u );
   BOOST_CHECK_EQUAL( m.price(0), 47425873u );
   BOOST_CHECK_EQUAL( m.price(1), 952574126u );

   BOOST_CHECK_EQUAL( m.buy_shares(0, 300000000), 7000000000u );
   BOOST_CHECK_EQUAL( m.cost(), 8018057647u );
   BOOST_CHECK_EQUAL( m.price(0), 982012130u );

   BOOST_CHECK_EQUAL( m.buy_shares(1, 200000000), 12000000000u );
   BOOST_CHECK_EQUAL( m.cost(), 15859016299u );
   BOOST_CHECK_EQUAL( m.price(0), 386217u );
   BOOST_CHECK_EQUAL( m.price(1), 999613782u );

   BOOST_CHECK_EQUAL( m.supplies[0], 8000000000u );
   BOOST_CHECK_EQUAL( m.supplies[1], 16000000000u );
   BOOST_CHECK_EQUAL( m.reserves[0], 800000000u );
   BOOST_CHECK_EQUAL( m.reserves[1], 1000000000u );
}

BOOST_AUTO_TEST_CASE( cost_grows_with_every_purchase )
{
   Market two( 2, 1000000000 );
   uint64_t prev = two.cost();
   for( auto t : std::vector<TradeAction>{ {0, 500000000}, {1, 800000000}, {0, 300000000}, {1, 200000000} } )
   {
      two.buy_shares(t.outcome, t.amount);
      uint64_t cur = two.cost();
      BOOST_CHECK_GT( cur, prev );
      check_price_sum(two);
      prev = cur;
   }

   Market four( 4, 10000000000 );
   prev = four.cost();
   for( auto t : std::vector<TradeAction>{ {1, 5000000000}, {3, 1000000000}, {2, 4000000000} } )
   {
      four.buy_shares(t.outcome, t.amount);
      uint64_t cur = four.cost();
      BOOST_CHECK_GT( cur, prev );
      check_price_sum(four);
      prev = cur;
   }
}

BOOST_AUTO_TEST_CASE( four_outcome_sequence )
{
   Market m( 4, 10000000000 );
   BOOST_CHECK_EQUAL( m.cost(), 13862943560u );
   for( size_t i = 0; i < 4; ++i )
      BOOST_CHECK_EQUAL( m.price(i), 250000000u );

   // too small against this liquidity to mint anything
   BOOST_CHECK_EXCEPTION( m.buy_shares(0, 2000000000), market_error, code_is{errc::shares_are_zero} );
   BOOST_CHECK_EQUAL( m.supplies[0], 0u );
   BOOST_CHECK_EQUAL( m.reserves[0], 0u );

   BOOST_CHECK_EQUAL( m.buy_shares(1, 5000000000), 20000000000u );
   BOOST_CHECK_EQUAL( m.cost(), 23407529530u );
   BOOST_CHECK_EQUAL( m.price(1), 711234593u );

   BOOST_CHECK_EQUAL( m.buy_shares(3, 1000000000), 10000000000u );
   BOOST_CHECK_EQUAL( m.cost(), 24938093070u );

   BOOST_CHECK_EQUAL( m.buy_shares(2, 4000000000), 50000000000u );
   BOOST_CHECK_EQUAL( m.cost(), 50721723460u );
   BOOST_CHECK_EQUAL( m.price(2), 930370460u );
   BOOST_CHECK_EQUAL( price_sum(m), 999999998u );
}

BOOST_AUTO_TEST_CASE( three_outcome_purchase )
{
   Market m( 3, 1000000000 );
   BOOST_CHECK_EQUAL( m.buy_shares(2, 1000000000), 5000000000u );
   BOOST_CHECK_EQUAL( m.cost(), 5013385822u );
   BOOST_CHECK_EQUAL( m.price(0), 6648355u );
   BOOST_CHECK_EQUAL( m.price(1), 6648355u );
   BOOST_CHECK_EQUAL( m.price(2), 986703289u );
}

BOOST_AUTO_TEST_CASE( small_liquidity_moves_price_further )
{
   Market m( 2, 10000000 );
   BOOST_CHECK_EQUAL( m.price(0), 500000000u );
   BOOST_CHECK_EQUAL( m.buy_shares(0, 5000000), 10000000u );
   BOOST_CHECK_EQUAL( m.price(0), 731058578u );
   BOOST_CHECK_EQUAL( m.price(1), 268941421u );
   BOOST_CHECK_GT( m.price(0) - 500000000, 100000000u );
   BOOST_CHECK_EQUAL( m.cost(), 13132616u );
}

BOOST_AUTO_TEST_CASE( zero_deposit )
{
   Market m( 2, 1000000000 );
   BOOST_CHECK_EXCEPTION( m.buy_shares(0, 0), market_error, code_is{errc::deposit_is_zero} );
}

BOOST_AUTO_TEST_CASE( degenerate_trade_mints_nothing )
{
   Market m( 2, 1000000000 );
   BOOST_CHECK_EXCEPTION( m.buy_shares(0, 1), market_error, code_is{errc::shares_are_zero} );
   BOOST_CHECK_EXCEPTION( m.buy_shares(0, 5000000), market_error, code_is{errc::shares_are_zero} );
   BOOST_CHECK_EQUAL( m.supplies[0], 0u );
   BOOST_CHECK_EQUAL( m.reserves[0], 0u );
   BOOST_CHECK_EQUAL( m.cost(), 693147180u );
}

BOOST_AUTO_TEST_CASE( failed_purchase_leaves_state_untouched )
{
   Market m( 2, 1000000000 );
   m.reserves[0] = std::numeric_limits<uint64_t>::max() - 1;
   BOOST_CHECK_EXCEPTION( m.buy_shares(0, 500000000), market_error, code_is{errc::math_overflow} );
   BOOST_CHECK_EQUAL( m.supplies[0], 0u );
   BOOST_CHECK_EQUAL( m.reserves[0], std::numeric_limits<uint64_t>::max() - 1 );
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE( market_runner )

BOOST_AUTO_TEST_CASE( run_records_failures_and_snapshots )
{
   MarketRunner runner( Market( 2, 1000000000 ) );
   std::vector<TradeAction> actions{ {0, 500000000}, {0, 1}, {1, 800000000} };

   RunResult run = runner.run( actions, 2 );
   BOOST_CHECK_EQUAL( run.trades, 2u );
   BOOST_CHECK_EQUAL( run.failed, 1u );
   BOOST_REQUIRE_EQUAL( run.actions.size(), 3u );

   BOOST_CHECK( run.actions[0].success );
   BOOST_CHECK_EQUAL( run.actions[0].shares_minted, 1000000000u );
   BOOST_CHECK( !run.actions[0].snapshot );

   BOOST_CHECK( !run.actions[1].success );
   BOOST_REQUIRE( run.actions[1].error );
   BOOST_CHECK( *run.actions[1].error == errc::shares_are_zero );
   BOOST_CHECK( !run.actions[1].message.empty() );
   BOOST_REQUIRE( run.actions[1].snapshot );
   BOOST_CHECK_EQUAL( run.actions[1].snapshot->cost, 1313261688u );

   BOOST_CHECK( run.actions[2].success );
   BOOST_CHECK_EQUAL( run.actions[2].shares_minted, 4000000000u );
   BOOST_CHECK( !run.actions[2].snapshot );

   BOOST_CHECK_EQUAL( run.final_state.cost, 4048587350u );
   BOOST_REQUIRE_EQUAL( run.final_state.prices.size(), 2u );
   BOOST_CHECK_EQUAL( run.final_state.prices[1], 952574126u );
   BOOST_CHECK_EQUAL( run.final_state.price_sum, 999999999u );
   BOOST_CHECK_EQUAL( run.final_state.supplies[1], 4000000000u );
   BOOST_CHECK_EQUAL( runner.market().reserves[1], 800000000u );
}

BOOST_AUTO_TEST_CASE( run_without_snapshots )
{
   MarketRunner runner( Market( 3, 1000000000 ) );
   RunResult run = runner.run( { {2, 1000000000}, {5, 1000}, {0, 0} }, 0 );
   BOOST_CHECK_EQUAL( run.trades, 1u );
   BOOST_CHECK_EQUAL( run.failed, 2u );
   for( const auto& r : run.actions )
      BOOST_CHECK( !r.snapshot );
   BOOST_CHECK( *run.actions[1].error == errc::invalid_outcome_index );
   BOOST_CHECK( *run.actions[2].error == errc::deposit_is_zero );
   BOOST_CHECK_EQUAL( run.final_state.cost, 5013385822u );
}

BOOST_AUTO_TEST_CASE( snapshot_reports_quote_error )
{
   Market m( 2, 1000000000 );
   m.supplies[0] = 25000000000;
   MarketSnapshot s = MarketRunner::snapshot(m);
   BOOST_REQUIRE( s.quote_error );
   BOOST_CHECK( *s.quote_error == errc::math_overflow );
   BOOST_CHECK_EQUAL( s.supplies[0], 25000000000u );
   BOOST_CHECK_EQUAL( s.cost, 0u );
   BOOST_CHECK( s.prices.empty() );
}

BOOST_AUTO_TEST_CASE( snapshot_of_oversized_market_stays_in_bounds )
{
   Market m( 2, 1000000000 );
   m.supplies[MAX_OUTCOMES - 1] = 7;
   m.num_outcomes = static_cast<uint8_t>(MAX_OUTCOMES + 24);
   MarketSnapshot s = MarketRunner::snapshot(m);
   BOOST_REQUIRE( s.quote_error );
   BOOST_CHECK( *s.quote_error == errc::too_many_outcomes );
   BOOST_REQUIRE_EQUAL( s.supplies.size(), MAX_OUTCOMES );
   BOOST_CHECK_EQUAL( s.reserves.size(), MAX_OUTCOMES );
   BOOST_CHECK_EQUAL( s.supplies.back(), 7u );
   BOOST_CHECK( s.prices.empty() );
}

BOOST_AUTO_TEST_SUITE_END()
