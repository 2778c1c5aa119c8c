// config.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "defs.h"
#include "graph/pack.h"

namespace otpack::config
{
	/*
	    Reads packer settings from a block like this:

	        pack begin
	            max_rounds 16
	            strategies [ promote duplicate split respace reprioritise ]
	            promote_eagerly false
	            verbose true
	        end

	    Anything not mentioned keeps its default. `#` starts a comment that runs to the end of the
	    line. The view is advanced past the block (and any whitespace after it).
	*/
	StrErrorOr<graph::PackOptions> parsePackOptions(zst::str_view& contents);
}
