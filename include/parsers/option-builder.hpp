#ifndef CHROMATIC_OPTION_BUILDER_HPP
#define CHROMATIC_OPTION_BUILDER_HPP

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string_view>
#include <unordered_map>
#include <vector>

class OptionBuilder
{
public:
	OptionBuilder( int ac, const char * const *av)
		: argv( av), argc( ac)
	{
	}

	void build()
	{
		int i = 1;
		bool options_ended = false;
		while( i < argc)
		{
			const char *current_option = argv[ i++];
			// Everything after a bare `--` is positional.
			if( !options_ended && strcmp( current_option, "--") == 0)
			{
				options_ended = true;
				continue;
			}
			if( options_ended)
			{
				if( positional_handler)
					positional_handler( current_option, i);
				continue;
			}
			int hypen_count = 0;
			while( *current_option == '-' && hypen_count < 2)
			{
				++current_option;
				++hypen_count;
			}
			if( hypen_count == 0 || *current_option == '\0')
			{
				if( positional_handler)
					positional_handler( argv[ i - 1], i);
				continue;
			}
			auto *equal_to_position = strchr( current_option, '=');
			std::string_view key = current_option, value;
			bool has_value = equal_to_position != nullptr;
			if( has_value)
			{
				key   = std::string_view( current_option, equal_to_position - current_option);
				value = equal_to_position + 1;
			}
			auto matching = options.find( key);
			if( matching != options.cend())
			{
				auto count = matching->second;
				auto& matched = matched_options[ canonical( key)];
				if( count > 0 && !has_value)
				{
					while( count-- && i < argc)
						matched.emplace_back( argv[ i++]);
				}
				else
					matched.emplace_back( has_value ? value : key);
			}
			else if( mis_handler)
				mis_handler( argv[ i - 1], i);
		}
	}

	std::vector<std::string_view> get( std::string_view key) const
	{
		auto match = matched_options.find( canonical( key));
		if( match != matched_options.cend())
			return match->second;
		auto default_match = options_default.find( key);
		if( default_match != options_default.cend())
			return default_match->second;
		return {};
	}

	const char *asDefault( std::string_view key) const
	{
		auto result = get( key);
		return result.empty() ? nullptr : result.front().data();
	}

	bool asBool( std::string_view key) const
	{
		return matched_options.find( canonical( key)) != matched_options.cend();
	}

	auto asInt( std::string_view key) const
	{
		auto result = asDefault( key);
		return result == nullptr ? 0 : strtol( result, nullptr, 10);
	}

	/*
	 * False when the value is missing, not entirely a number or not finite.
	 */
	bool asDouble( std::string_view key, double &value) const
	{
		auto result = asDefault( key);
		if( result == nullptr)
			return false;
		char *end = nullptr;
		value = strtod( result, &end);
		return end != result && *end == '\0' && std::isfinite( value);
	}

	void addMismatchConsumer( const std::function<void(const char *, int)>& handler)
	{
		mis_handler = handler;
	}

	void addPositionalConsumer( const std::function<void(const char *, int)>& handler)
	{
		positional_handler = handler;
	}

	OptionBuilder& addOption( const char *long_key, const char *short_key = nullptr,
							  const std::vector<std::string_view>& default_values = {}, int n_args = 0)
	{
		options[ long_key] = n_args;
		if( short_key != nullptr)
		{
			options[ short_key] = n_args;
			option_pair[ short_key] = long_key;
			if( !default_values.empty())
				options_default[ short_key] = default_values;
		}
		if( !default_values.empty())
			options_default[ long_key] = default_values;

		return *this;
	}

	OptionBuilder& addOption( const char *long_key, const char *short_key,
							  std::string_view default_value, int n_args = 0)
	{
		return addOption( long_key, short_key, std::vector<std::string_view>{ default_value}, n_args);
	}

private:
	// Short keys are stored under their long form.
	std::string_view canonical( std::string_view key) const
	{
		auto o_key = option_pair.find( key);
		return o_key == option_pair.cend() ? key : o_key->second;
	}

	std::unordered_map<std::string_view, size_t> options;
	std::unordered_map<std::string_view, std::string_view> option_pair;
	std::unordered_map<std::string_view, std::vector<std::string_view>> matched_options;
	std::unordered_map<std::string_view, std::vector<std::string_view>> options_default;
	const char * const *argv;
	int argc;
	std::function<void(const char *, int)> mis_handler;
	std::function<void(const char *, int)> positional_handler;
};
#endif //CHROMATIC_OPTION_BUILDER_HPP
