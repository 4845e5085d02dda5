#include <puzzlevault/chain/controller.hpp>
#include <puzzlevault/chain/contract_types.hpp>
#include <puzzlevault/chain/puzzle_vault.hpp>
#include <puzzlevault/chain/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>
#include <fc/variant.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>

#include <iostream>

using namespace puzzlevault::chain;
namespace bpo = boost::program_options;
using bpo::options_description;
using bpo::variables_map;

enum return_codes {
   SUCCESS        = 0,
   USAGE_FAIL     = 1,
   ACTION_FAIL    = 2,
   OTHER_FAIL     = 3
};

struct vault_tool {
   void set_program_options(options_description& cli);
   void initialize(const variables_map& options);
   int  run();

   controller::config               cfg;
   fc::path                         logconf;
   account_name                     actor;
   bool                             print_trace = false;
   bool                             help        = false;

   std::optional<std::string>       hash_text;
   std::optional<action>            act;
};

void vault_tool::set_program_options(options_description& cli)
{
   cli.add_options()
         ("state-dir", bpo::value<std::string>()->default_value(config::default_state_dir_name),
          "the location of the vault state directory (absolute path or relative to the current directory)")
         ("state-size-mb", bpo::value<uint64_t>()->default_value(config::default_state_size / config::_MB),
          "maximum size (in MiB) of the vault state file")
         ("logconf", bpo::value<std::string>()->default_value("logging.json"),
          "logging configuration file; the default logging configuration is used when it does not exist")
         ("contracts-console", bpo::bool_switch(&cfg.contracts_console)->default_value(false),
          "print contract console output to the log")
         ("account", bpo::value<std::string>()->default_value(config::default_vault_account_name),
          "account the vault contract is deployed on")
         ("actor", bpo::value<std::string>()->default_value(config::default_actor_name),
          "account submitting the action")
         ("hash", bpo::value<std::string>(),
          "print the hex encoded SHA-256 digest of the given solution and exit")
         ("initialize", bpo::value<std::string>(),
          "commit the given hex encoded SHA-256 solution digest")
         ("guess", bpo::value<std::string>(),
          "submit a guess; prints true or false")
         ("get-solution", bpo::bool_switch()->default_value(false),
          "print the committed solution digest")
         ("print-trace", bpo::bool_switch(&print_trace)->default_value(false),
          "print the JSON trace of the applied action")
         ("help,h", bpo::bool_switch(&help)->default_value(false), "Print this help message and exit.")
         ;
}

void vault_tool::initialize(const variables_map& options) {
   cfg.state_dir     = options.at( "state-dir" ).as<std::string>();
   cfg.state_size    = options.at( "state-size-mb" ).as<uint64_t>() * config::_MB;
   cfg.vault_account = options.at( "account" ).as<std::string>();
   logconf           = options.at( "logconf" ).as<std::string>();
   actor             = options.at( "actor" ).as<std::string>();

   uint32_t commands = 0;
   if( options.count( "hash" ) ) {
      hash_text = options.at( "hash" ).as<std::string>();
      ++commands;
   }
   if( options.count( "initialize" ) ) {
      act = action( cfg.vault_account, actor, puzzlevault::chain::initialize{ options.at( "initialize" ).as<std::string>() } );
      ++commands;
   }
   if( options.count( "guess" ) ) {
      act = action( cfg.vault_account, actor, guess{ options.at( "guess" ).as<std::string>() } );
      ++commands;
   }
   if( options.at( "get-solution" ).as<bool>() ) {
      act = action( cfg.vault_account, actor, get_solution{} );
      cfg.read_only = true;
      ++commands;
   }
   FC_ASSERT( commands == 1, "exactly one of --hash, --initialize, --guess or --get-solution must be given" );
}

int vault_tool::run() {
   if( hash_text ) {
      std::cout << puzzle_vault::hash_solution( *hash_text ).str() << std::endl;
      return SUCCESS;
   }

   if( fc::exists( logconf ) )
      fc::configure_logging( logconf );
   else
      fc::configure_logging( fc::logging_config::default_config() );

   dlog( "vault configuration: ${c}", ("c", cfg) );
   controller control( cfg );
   auto trace = control.push_action( *act );

   if( print_trace )
      std::cout << fc::json::to_pretty_string( variant( *trace ) ) << std::endl;

   if( trace->except ) {
      elog( "${e}", ("e", trace->except->to_detail_string()) );
      std::cerr << trace->except->top_message() << std::endl;
      return ACTION_FAIL;
   }

   if( !print_trace ) {
      if( !trace->console.empty() )
         std::cerr << trace->console << std::endl;
      if( trace->return_value ) {
         const auto& rv = *trace->return_value;
         std::cout << ( rv.is_bool() ? std::string( rv.as_bool() ? "true" : "false" ) : rv.as_string() ) << std::endl;
      }
   }
   return SUCCESS;
}

int main(int argc, char** argv)
{
   vault_tool tool;
   try {
      bpo::options_description cli ("pvault command line options");
      tool.set_program_options(cli);
      bpo::variables_map vmap;
      bpo::store(bpo::parse_command_line(argc, argv, cli), vmap);
      bpo::notify(vmap);
      if (tool.help) {
         cli.print(std::cerr);
         return SUCCESS;
      }
      tool.initialize(vmap);
   } catch( const fc::exception& e ) {
      std::cerr << e.top_message() << std::endl;
      return USAGE_FAIL;
   } catch( const bpo::error& e ) {
      std::cerr << e.what() << std::endl;
      return USAGE_FAIL;
   }

   try {
      return tool.run();
   } catch( const fc::exception& e ) {
      elog( "${e}", ("e", e.to_detail_string()));
   } catch( const boost::exception& e ) {
      elog("${e}", ("e",boost::diagnostic_information(e)));
   } catch( const std::exception& e ) {
      elog("${e}", ("e",e.what()));
   }
   return OTHER_FAIL;
}
