#ifndef DIFFERENCE_INTERPOLATION_DIFFERENCE_INTERPOLATION_H
#define DIFFERENCE_INTERPOLATION_DIFFERENCE_INTERPOLATION_H

#include "types.h"
#include "errors.h"
#include "sample_points.h"
#include "polynomial.h"
#include "difference_table.h"
#include "node_selector.h"
#include "difference_series.h"
#include "interpolation.h"
#include "error_estimator.h"
#include "interpolator.h"
#include "hermite_spline.h"
#include "config_reader.h"
#include "validator.h"
#include "result_formatter.h"

#endif // DIFFERENCE_INTERPOLATION_DIFFERENCE_INTERPOLATION_H
