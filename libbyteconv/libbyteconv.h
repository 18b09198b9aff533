//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov

#ifndef _libbyteconv_h_
#define _libbyteconv_h_

#include "byte.h"
#include "conventions.h"
#include "except.h"
#include "num_format.h"
#include "num_parse.h"
#include "number_styles.h"

#endif
