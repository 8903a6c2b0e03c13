/**
    Copyright 2017-2019, Felspar Co Ltd. <http://support.felspar.com/>

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
*/


#pragma once


#include <fost/core>


namespace coproc {


    /// Logging for a worker program. Messages go to stderr as one JSON
    /// object per line so they never mix with the channel on stdout
    fostlib::json child_logging();

    /// Logging for the driver. Warnings and above go to stderr
    fostlib::json parent_logging();


}
