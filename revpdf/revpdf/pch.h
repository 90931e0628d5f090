#pragma once

#include <cstdlib>
#include <cstring>
#include <cstdio>

#include <algorithm>
#include <string>
#include <vector>
#include <map>
#include <set>

#include <boost/shared_ptr.hpp>

#include "errors.h"
#include "debug_output.h"
#include "config.h"
#include "mapped_file.h"
#include "types.h"
#include "XrefSection.h"
#include "revision.h"
#include "revisions.h"
#include "resolver.h"
#include "document.h"

#include "../Filter_Flate/flate.h"
