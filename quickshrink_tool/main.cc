/*
 * Copyright (c) 2022 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <charconv>
#include <complex>
#include <iomanip>
#include <iostream>
#include <libbio/dispatch.hh>
#include <libbio/file_handling.hh>
#include <libbio/utility.hh>
#include <limits>
#include <optional>
#include <quickshrink/complex_strategy.hh>
#include <quickshrink/dispatch_executor.hh>
#include <quickshrink/find.hh>
#include <quickshrink/strategy_table.hh>
#include <range/v3/view/enumerate.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include "cmdline.h"

namespace ios	= boost::iostreams;
namespace lb	= libbio;
namespace qs	= quickshrink;
namespace rsv	= ranges::views;


namespace {

	typedef std::pair <double, double>	complex_template_type;
	
	
	struct search_delegate final : public qs::search_delegate
	{
		void found_satisfying_example(qs::basic_value const &example, std::size_t const examples_tried) override
		{
			lb::log_time(std::cerr) << "Found a satisfying example " << example << " after " << examples_tried << " draws; simplifying…\n";
		}
		
		void simplified_example(qs::basic_value const &example, std::size_t const shrink_count) override
		{
			lb::log_time(std::cerr) << "Simplification " << shrink_count << ": " << example << ".\n";
		}
		
		void finished_simplifying(qs::basic_value const &example, std::size_t const shrink_count) override
		{
			lb::log_time(std::cerr) << "Finished simplifying after " << shrink_count << " steps; the simplest example is " << example << ".\n";
		}
	};
	
	
	template <typename t_value>
	t_value parse_bound(char const *str, char const *option_name)
	{
		if (!str)
		{
			std::cerr << "ERROR: --" << option_name << " is required with the given descriptor.\n";
			std::exit(EXIT_FAILURE);
		}
		
		std::string_view const sv(str);
		t_value retval{};
		auto const res(std::from_chars(sv.data(), sv.data() + sv.size(), retval));
		if (std::errc() != res.ec || sv.data() + sv.size() != res.ptr)
		{
			std::cerr << "ERROR: Unable to parse the value of --" << option_name << ".\n";
			std::exit(EXIT_FAILURE);
		}
		
		return retval;
	}
	
	
	template <typename t_value>
	void output_value(std::ostream &os, t_value const &value)
	{
		os << value;
	}
	
	
	void output_value(std::ostream &os, std::complex <double> const &value)
	{
		os << value.real() << '\t' << value.imag();
	}
	
	
	// Resolves the strategy for the given descriptor kind and passes it to fn.
	template <typename t_fn>
	void with_strategy(gengetopt_args_info const &args_info, qs::strategy_table const &table, t_fn &&fn)
	{
		std::string_view const kind(args_info.descriptor_arg);
		if ("int" == kind)
			fn(table.resolve_as <qs::integer_type>(qs::type_descriptor::of <qs::integer_type>()));
		else if ("float" == kind)
			fn(table.resolve_as <double>(qs::type_descriptor::of <double>()));
		else if ("complex" == kind)
			fn(table.resolve_as <complex_template_type, std::complex <double>>(qs::type_descriptor::of <std::complex <double>>()));
		else if ("integer-range" == kind)
		{
			auto const lower(parse_bound <qs::integer_type>(args_info.lower_bound_arg, "lower-bound"));
			auto const upper(parse_bound <qs::integer_type>(args_info.upper_bound_arg, "upper-bound"));
			fn(table.resolve_as <qs::integer_type>(qs::integer_range(lower, upper)));
		}
		else if ("float-range" == kind)
		{
			auto const lower(parse_bound <double>(args_info.lower_bound_arg, "lower-bound"));
			auto const upper(parse_bound <double>(args_info.upper_bound_arg, "upper-bound"));
			fn(table.resolve_as <double>(qs::float_range(lower, upper)));
		}
		else
		{
			std::cerr << "ERROR: Unknown descriptor “" << kind << "”.\n";
			std::exit(EXIT_FAILURE);
		}
	}
	
	
	template <typename t_template, typename t_value>
	void generate(qs::search_strategy <t_template, t_value> const &strategy, gengetopt_args_info const &args_info)
	{
		qs::random_source rng(args_info.seed_arg);
		std::vector <qs::basic_value> basic_values;
		qs::parameter_value pv;
		
		lb::log_time(std::cerr) << "Generating " << args_info.count_arg << " values of " << strategy.get_descriptor() << "…\n";
		for (long i(0); i < args_info.count_arg; ++i)
		{
			if (0 == i % args_info.examples_per_parameter_arg)
				pv = strategy.draw_parameter(rng);
				
			auto const tpl(strategy.produce_template(rng, pv));
			output_value(std::cout, strategy.reify(tpl));
			std::cout << '\n';
			
			if (args_info.simplify_flag)
			{
				auto const candidates(strategy.simplify(tpl).take(args_info.simplify_limit_arg));
				for (auto const &[idx, candidate] : rsv::enumerate(candidates))
				{
					std::cout << '\t' << (1 + idx) << '\t';
					output_value(std::cout, strategy.reify(candidate));
					std::cout << '\n';
				}
			}
			
			if (args_info.output_arg)
				basic_values.push_back(strategy.to_basic(tpl));
		}
		std::cout << std::flush;
		
		if (args_info.output_arg)
		{
			lb::log_time(std::cerr) << "Writing the basic forms to " << args_info.output_arg << "…\n";
			lb::file_ostream stream;
			lb::open_file_for_writing(args_info.output_arg, stream, lb::writing_open_mode::CREATE);
			
			ios::filtering_ostream out;
			if (args_info.gzip_flag)
				out.push(ios::gzip_compressor());
			out.push(stream);
			qs::save_basic_values(out, basic_values);
			
			// Flush the compressor.
			out.reset();
			stream << std::flush;
		}
	}
	
	
	template <typename t_template, typename t_value>
	void replay(qs::search_strategy <t_template, t_value> const &strategy, char const *path, bool const input_is_gzipped)
	{
		std::vector <qs::basic_value> basic_values;
		
		{
			lb::log_time(std::cerr) << "Reading the basic forms from " << path << "…\n";
			lb::file_istream stream;
			lb::open_file_for_reading(path, stream);
			
			ios::filtering_istream in;
			if (input_is_gzipped)
				in.push(ios::gzip_decompressor());
			in.push(stream);
			qs::load_basic_values(in, basic_values);
		}
		
		std::size_t skipped_count(0);
		for (auto const &[idx, data] : rsv::enumerate(basic_values))
		{
			try
			{
				auto const tpl(strategy.from_basic(data));
				output_value(std::cout, strategy.reify(tpl));
				std::cout << '\n';
			}
			catch (qs::bad_data const &exc)
			{
				lb::log_time(std::cerr) << "WARNING: Skipping example " << idx << ": " << exc.what() << '\n';
				++skipped_count;
			}
		}
		std::cout << std::flush;
		
		lb::log_time(std::cerr) << "Replayed " << (basic_values.size() - skipped_count) << " examples, skipped " << skipped_count << ".\n";
	}
	
	
	// Finds the simplest integer above a threshold. The condition is evaluated
	// asynchronously on the serial queue of the executor.
	class minimal_value_finder
	{
	protected:
		std::optional <qs::dispatch_executor>			m_executor;
		qs::search_strategy_ptr <qs::integer_type>		m_strategy;
		qs::search_settings								m_settings;
		search_delegate									m_delegate;
		qs::integer_type								m_threshold{};
		long											m_seed{};
		
	public:
		minimal_value_finder() = default;
		
		minimal_value_finder(
			qs::search_strategy_ptr <qs::integer_type> strategy,
			gengetopt_args_info const &args_info
		):
			m_executor(std::in_place, "fi.iki.tsnorri.quickshrink.serial-queue"),
			m_strategy(std::move(strategy)),
			m_threshold(args_info.find_minimal_above_arg),
			m_seed(args_info.seed_arg)
		{
			m_settings.max_examples = args_info.max_examples_arg;
			m_settings.examples_per_parameter = args_info.examples_per_parameter_arg;
			m_settings.max_shrinks = args_info.max_shrinks_arg;
		}
		
		dispatch_queue_t queue() const { return m_executor->queue(); }
		
		void process();
		void operator()() { process(); } // For lb::dispatch().
	};
	
	
	void minimal_value_finder::process()
	{
		lb::log_time(std::cerr) << "Searching for the simplest value of " << m_strategy->get_descriptor() << " not less than " << m_threshold << "…\n";
		
		auto const threshold(m_threshold);
		auto &executor(*m_executor);
		auto res(qs::find_async(
			m_strategy,
			[&executor, threshold](qs::integer_type const value){
				return qs::defer(executor, [value, threshold](){ return threshold <= value; });
			},
			m_settings,
			qs::random_source(m_seed),
			m_delegate
		));
		
		res.add_callback([](qs::pending_result <qs::integer_type> const &pr){
			try
			{
				auto const value(pr.get());
				std::cout << value << '\n' << std::flush;
				std::exit(EXIT_SUCCESS);
			}
			catch (std::exception const &exc)
			{
				lb::log_time(std::cerr) << "ERROR: " << exc.what() << ".\n";
				std::exit(EXIT_FAILURE);
			}
		});
	}
	
	
	static minimal_value_finder s_finder;
	
	
	// Try to make sure that this function does not get inlined since the
	// try-catch block can somehow problems with dispatch_main()
	// (“terminate called without an active exception”).
	void __attribute__((noinline)) do_process(gengetopt_args_info const &args_info) noexcept
	{
		try
		{
			if (args_info.count_arg < 0)
			{
				std::cerr << "ERROR: Count must be non-negative.\n";
				std::exit(EXIT_FAILURE);
			}
			
			if (args_info.examples_per_parameter_arg <= 0)
			{
				std::cerr << "ERROR: Examples per parameter must be positive.\n";
				std::exit(EXIT_FAILURE);
			}
			
			if (args_info.simplify_limit_arg < 0)
			{
				std::cerr << "ERROR: Simplify limit must be non-negative.\n";
				std::exit(EXIT_FAILURE);
			}
			
			if (args_info.max_examples_arg <= 0 || args_info.max_shrinks_arg < 0)
			{
				std::cerr << "ERROR: Max examples must be positive and max shrinks non-negative.\n";
				std::exit(EXIT_FAILURE);
			}
			
			std::cout << std::setprecision(std::numeric_limits <double>::max_digits10);
			auto const table(qs::make_default_strategy_table());
			
			if (args_info.find_minimal_above_given)
			{
				std::string_view const kind(args_info.descriptor_arg);
				if (! ("int" == kind || "integer-range" == kind))
				{
					std::cerr << "ERROR: --find-minimal-above may only be used with int and integer-range.\n";
					std::exit(EXIT_FAILURE);
				}
				
				with_strategy(args_info, table, [&args_info](auto const &strategy){
					if constexpr (std::is_same_v <std::remove_cvref_t <decltype(strategy)>, qs::search_strategy_ptr <qs::integer_type>>)
					{
						s_finder = minimal_value_finder(strategy, args_info);
						lb::dispatch(s_finder).async <>(s_finder.queue());
					}
				});
				
				// Continued in s_finder.
				return;
			}
			
			with_strategy(args_info, table, [&args_info](auto const &strategy){
				if (args_info.replay_arg)
					replay(*strategy, args_info.replay_arg, args_info.gzip_flag);
				else
					generate(*strategy, args_info);
			});
			
			std::exit(EXIT_SUCCESS);
		}
		catch (std::exception const &exc)
		{
			std::cerr << "Top-level exception handler caught an exception: " << exc.what() << ".\n";
			std::exit(EXIT_FAILURE);
		}
		catch (...)
		{
			std::cerr << "Top-level exception handler caught a non-std::exception.\n";
			std::exit(EXIT_FAILURE);
		}
	}
}


int main(int argc, char **argv)
{
#ifndef NDEBUG
	std::cerr << "Assertions have been enabled." << std::endl;
#endif

	gengetopt_args_info args_info;
	if (0 != cmdline_parser(argc, argv, &args_info))
		std::exit(EXIT_FAILURE);
		
	std::ios_base::sync_with_stdio(false);	// Don't use C style IO after calling cmdline_parser.
	std::cin.tie(nullptr);					// We don't require any input from the user.
	
	std::cerr << "Invocation:\n";
	for (int i(0); i < argc; ++i)
	{
		if (i)
			std::cerr << ' ';
		std::cerr << argv[i];
	}
	std::cerr << '\n';
	
	do_process(args_info);
	
	dispatch_main();
	// Not reached.
	return EXIT_SUCCESS;
}
