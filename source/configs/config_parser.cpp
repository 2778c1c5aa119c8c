// config_parser.cpp
// Copyright (c) 2022, yuki
// SPDX-License-Identifier: Apache-2.0

#include <charconv>

#include "util.h"
#include "otpack/config.h"

namespace otpack::config
{
	static bool skip_one_ws(zst::str_view& sv)
	{
		if(sv.empty())
			return false;

		bool ret = false;
		while(not sv.empty() && util::is_one_of(sv[0], ' ', '\t', '\n', '\r'))
			ret = true, sv.remove_prefix(1);

		if(not sv.empty() && sv[0] == '#')
			ret = true, sv = sv.drop_until('\n');

		return ret;
	}

	static void skip_whitespace_and_comments(zst::str_view& sv)
	{
		while(skip_one_ws(sv))
			;
	}

	static StrErrorOr<void> expect(zst::str_view& sv, zst::str_view kw)
	{
		skip_whitespace_and_comments(sv);
		if(not sv.starts_with(kw))
			return ErrFmt("expected '{}', got '{}'", kw, sv.take(kw.size()));

		sv.remove_prefix(kw.size());
		return Ok();
	}

	static zst::str_view consume_token(zst::str_view& sv)
	{
		skip_whitespace_and_comments(sv);
		return sv.take_prefix(sv.find_first_of(" \t\r\n"));
	}

	static zst::str_view peek_token(zst::str_view& sv)
	{
		skip_whitespace_and_comments(sv);
		return sv.take(sv.find_first_of(" \t\r\n"));
	}

	static StrErrorOr<size_t> parse_count(zst::str_view sv)
	{
		size_t ret = 0;
		auto [ptr, ec] = std::from_chars(sv.begin(), sv.end(), ret);

		if(ec != std::errc() || sv.empty())
			return ErrFmt("expected a number, got '{}'", sv);

		if(ptr != sv.end())
			return ErrFmt("garbage at end of number: '{}'", sv.drop(static_cast<size_t>(ptr - sv.begin())));

		return Ok(ret);
	}

	static StrErrorOr<bool> parse_bool(zst::str_view sv)
	{
		if(sv == "true")
			return Ok(true);
		else if(sv == "false")
			return Ok(false);

		return ErrFmt("expected 'true' or 'false', got '{}'", sv);
	}

	static StrErrorOr<graph::Strategy> parse_strategy(zst::str_view sv)
	{
		using graph::Strategy;
		for(auto s : { Strategy::Promote, Strategy::Duplicate, Strategy::Split, Strategy::Respace, Strategy::Reprioritise })
		{
			if(sv == graph::strategyName(s))
				return Ok(s);
		}

		return ErrFmt("unknown strategy '{}'", sv);
	}

	static StrErrorOr<std::vector<graph::Strategy>> parse_strategy_list(zst::str_view& sv)
	{
		TRY(expect(sv, "["));

		std::vector<graph::Strategy> ret {};
		while(not sv.empty() && peek_token(sv) != "]")
		{
			auto tok = consume_token(sv);
			if(tok.ends_with(']'))
				tok.transfer_suffix(sv, 1);

			auto strategy = TRY(parse_strategy(tok));
			if(std::find(ret.begin(), ret.end(), strategy) != ret.end())
				return ErrFmt("strategy '{}' listed twice", tok);

			ret.push_back(strategy);
		}

		TRY(expect(sv, "]"));
		return Ok(std::move(ret));
	}

	StrErrorOr<graph::PackOptions> parsePackOptions(zst::str_view& sv)
	{
		graph::PackOptions options {};

		TRY(expect(sv, "pack"));
		TRY(expect(sv, "begin"));

		while(not sv.empty() && peek_token(sv) != "end")
		{
			auto key = consume_token(sv);
			if(key == "max_rounds")
			{
				options.max_rounds = TRY(parse_count(consume_token(sv)));
			}
			else if(key == "strategies")
			{
				options.strategies = TRY(parse_strategy_list(sv));
			}
			else if(key == "promote_eagerly")
			{
				options.promote_eagerly = TRY(parse_bool(consume_token(sv)));
			}
			else if(key == "verbose")
			{
				options.verbose = TRY(parse_bool(consume_token(sv)));
			}
			else
			{
				return ErrFmt("unknown setting '{}'", key);
			}
		}

		TRY(expect(sv, "end"));

		// consume trailing whitespace to prepare for the next.
		skip_whitespace_and_comments(sv);

		return Ok(std::move(options));
	}
}
