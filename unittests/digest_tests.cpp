#include <boost/test/unit_test.hpp>

#include <puzzlevault/chain/puzzle_vault.hpp>
#include <puzzlevault/chain/exceptions.hpp>
#include <puzzlevault/testing/tester.hpp>

#include <boost/algorithm/string/case_conv.hpp>

using namespace puzzlevault::chain;
using namespace puzzlevault::testing;

BOOST_AUTO_TEST_SUITE(digest_tests)

BOOST_AUTO_TEST_CASE(hash_reference_solution) try {
   BOOST_CHECK_EQUAL( puzzle_vault::hash_solution( reference_solution ).str(), reference_solution_hash );
   BOOST_CHECK_EQUAL( puzzle_vault::hash_solution( "" ).str(),
                      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" );
   BOOST_CHECK( puzzle_vault::hash_solution( "Near Nomicon Ref Finance" ) != puzzle_vault::hash_solution( reference_solution ) );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(parse_digest) try {
   auto digest = puzzle_vault::parse_digest( reference_solution_hash );
   BOOST_CHECK_EQUAL( digest.str(), reference_solution_hash );
   BOOST_CHECK( digest == puzzle_vault::hash_solution( reference_solution ) );

   auto upper = boost::algorithm::to_upper_copy( std::string( reference_solution_hash ) );
   BOOST_CHECK( puzzle_vault::parse_digest( upper ) == digest );
   BOOST_CHECK_EQUAL( puzzle_vault::parse_digest( upper ).str(), reference_solution_hash );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(parse_malformed_digest) try {
   std::string hash = reference_solution_hash;

   BOOST_CHECK_THROW( puzzle_vault::parse_digest( "" ), invalid_digest_exception );
   BOOST_CHECK_THROW( puzzle_vault::parse_digest( hash.substr( 0, 62 ) ), invalid_digest_exception );
   BOOST_CHECK_THROW( puzzle_vault::parse_digest( hash + "00" ), invalid_digest_exception );
   BOOST_CHECK_THROW( puzzle_vault::parse_digest( "0x" + hash.substr( 2 ) ), invalid_digest_exception );
   BOOST_CHECK_THROW( puzzle_vault::parse_digest( hash.substr( 0, 63 ) + "g" ), invalid_digest_exception );
   BOOST_CHECK_THROW( puzzle_vault::parse_digest( reference_solution ), invalid_digest_exception );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
