// __BEGIN_LICENSE__
//  Copyright (c) 2009-2013, United States Government as represented by the
//  Administrator of the National Aeronautics and Space Administration. All
//  rights reserved.
//
//  The NGT platform is licensed under the Apache License, Version 2.0 (the
//  "License"); you may not use this file except in compliance with the
//  License. You may obtain a copy of the License at
//  http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.
// __END_LICENSE__


/// \file Exceptions.h
///
/// Failures raised by the co-registration engine. Per-cell invalidity is
/// carried as NaN in the grids and is never reported through these.

#ifndef __COREG_CORE_EXCEPTIONS_H__
#define __COREG_CORE_EXCEPTIONS_H__

#include <vw/Core/Exception.h>

namespace coreg {

  /// Two grids that must share dimensions do not.
  VW_DEFINE_EXCEPTION(ShapeMismatchErr, vw::Exception);

  /// Too few finite samples for a reduction or a fit.
  VW_DEFINE_EXCEPTION(InsufficientDataErr, vw::Exception);

  /// A solver did not converge, or the system is rank-deficient.
  VW_DEFINE_EXCEPTION(SingularFitErr, vw::Exception);

  /// A parameter that must be finite, or in range, is not.
  VW_DEFINE_EXCEPTION(InvalidInputErr, vw::Exception);

} // end namespace coreg

#endif // __COREG_CORE_EXCEPTIONS_H__
