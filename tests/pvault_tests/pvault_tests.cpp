#define BOOST_TEST_MODULE pvault_tests
#include <boost/test/included/unit_test.hpp>

#include <puzzlevault/chain/puzzle_vault.hpp>
#include <puzzlevault/testing/tester.hpp>

#include <fc/filesystem.hpp>

#include <boost/process.hpp>

#include <string>
#include <vector>

using namespace puzzlevault::testing;
namespace bp = boost::process;

namespace {

struct run_result {
   int            exit_code = -1;
   std::string    out;
};

/// runs pvault with the given arguments; stderr carries logging and is discarded
run_result run_pvault( const std::vector<std::string>& args ) {
   bp::ipstream out;
   bp::child c( PVAULT_PATH, bp::args( args ), bp::std_out > out, bp::std_err > bp::null, bp::std_in < bp::null );

   run_result result;
   std::string line;
   while( std::getline( out, line ) )
      result.out += line + "\n";
   c.wait();
   result.exit_code = c.exit_code();
   return result;
}

struct state_fixture {
   std::vector<std::string> with_state( std::vector<std::string> args )const {
      args.insert( args.begin(), { "--state-dir", (tempdir.path() / "state").generic_string(),
                                   "--state-size-mb", "8" } );
      return args;
   }

   fc::temp_directory tempdir;
};

}

BOOST_AUTO_TEST_SUITE(pvault_tests)

BOOST_AUTO_TEST_CASE(hash_command) {
   auto r = run_pvault( { "--hash", reference_solution } );
   BOOST_CHECK_EQUAL( r.exit_code, 0 );
   BOOST_CHECK_EQUAL( r.out, std::string( reference_solution_hash ) + "\n" );
}

BOOST_FIXTURE_TEST_CASE(initialize_and_guess, state_fixture) {
   auto r = run_pvault( with_state( { "--initialize", reference_solution_hash } ) );
   BOOST_REQUIRE_EQUAL( r.exit_code, 0 );
   BOOST_CHECK_EQUAL( r.out, "" );

   r = run_pvault( with_state( { "--guess", reference_solution, "--actor", "alice" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 0 );
   BOOST_CHECK_EQUAL( r.out, "true\n" );

   r = run_pvault( with_state( { "--guess", "wrong answer" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 0 );
   BOOST_CHECK_EQUAL( r.out, "false\n" );

   r = run_pvault( with_state( { "--guess", "Near Nomicon Ref Finance" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 0 );
   BOOST_CHECK_EQUAL( r.out, "false\n" );

   // a second commit fails and leaves the first digest in place
   auto other = puzzlevault::chain::puzzle_vault::hash_solution( "another puzzle" ).str();
   r = run_pvault( with_state( { "--initialize", other } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 2 );
   BOOST_CHECK_EQUAL( r.out, "" );

   r = run_pvault( with_state( { "--get-solution" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 0 );
   BOOST_CHECK_EQUAL( r.out, std::string( reference_solution_hash ) + "\n" );

   r = run_pvault( with_state( { "--guess", reference_solution } ) );
   BOOST_CHECK_EQUAL( r.out, "true\n" );
}

BOOST_FIXTURE_TEST_CASE(action_failures, state_fixture) {
   auto r = run_pvault( with_state( { "--initialize", "abc" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 2 );
   BOOST_CHECK_EQUAL( r.out, "" );

   r = run_pvault( with_state( { "--guess", reference_solution } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 2 );
   BOOST_CHECK_EQUAL( r.out, "" );
}

BOOST_FIXTURE_TEST_CASE(get_solution_opens_state_read_only, state_fixture) {
   // a read-only open cannot create the state database
   auto r = run_pvault( with_state( { "--get-solution" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 3 );
   BOOST_CHECK_EQUAL( r.out, "" );

   r = run_pvault( with_state( { "--initialize", reference_solution_hash } ) );
   BOOST_REQUIRE_EQUAL( r.exit_code, 0 );
   r = run_pvault( with_state( { "--get-solution" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 0 );
   BOOST_CHECK_EQUAL( r.out, std::string( reference_solution_hash ) + "\n" );
}

BOOST_FIXTURE_TEST_CASE(exactly_one_command, state_fixture) {
   auto r = run_pvault( with_state( {} ) );
   BOOST_CHECK_EQUAL( r.exit_code, 1 );

   r = run_pvault( with_state( { "--guess", "a", "--get-solution" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 1 );

   r = run_pvault( with_state( { "--hash", "a", "--initialize", reference_solution_hash } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 1 );

   r = run_pvault( with_state( { "--no-such-option" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 1 );

   // nothing was committed by the rejected command lines
   r = run_pvault( with_state( { "--guess", "a" } ) );
   BOOST_CHECK_EQUAL( r.exit_code, 2 );
}

BOOST_AUTO_TEST_SUITE_END()
