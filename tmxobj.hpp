//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2026 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of tracemux.
//
//  tracemux is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  tracemux is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with tracemux. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __tracemux__tmxobj__
#define __tracemux__tmxobj__

#include "tracemux_minimal.hpp"

#include <boost/intrusive_ptr.hpp>

namespace tmx {

  class TmxObj;

  void intrusive_ptr_add_ref(TmxObj* o);
  void intrusive_ptr_release(TmxObj* o);

  /// base class for all reference counted tracemux objects
  /// @note objects are kept alive by boost::intrusive_ptr<> only, never delete them explicitly
  class TmxObj
  {
    friend void intrusive_ptr_add_ref(TmxObj* o);
    friend void intrusive_ptr_release(TmxObj* o);

    int refCount;

  public:

    TmxObj() : refCount(0) {};
    virtual ~TmxObj() {};

  };
  typedef boost::intrusive_ptr<TmxObj> TmxObjPtr;

} // namespace tmx

#endif /* defined(__tracemux__tmxobj__) */
