//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/parser_config.hpp>
#include <pathmatch/detail/except.hpp>

namespace pathmatch {

std::shared_ptr<parser_config const>
make_parser_config(parser_config cfg)
{
    if(cfg.max_segments < 1)
        detail::throw_invalid_argument(
            "max_segments cannot be zero");

    return std::make_shared<
        parser_config const>(std::move(cfg));
}

} // pathmatch
