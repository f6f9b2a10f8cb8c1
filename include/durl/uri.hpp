#pragma once

#include <durl/uri/url_codec.hpp>
#include <durl/uri/data_url.hpp>
