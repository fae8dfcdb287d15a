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

#include "tmxobj.hpp"


using namespace tmx;

namespace tmx {

  void intrusive_ptr_add_ref(TmxObj* o)
  {
    ++(o->refCount);
  }

  void intrusive_ptr_release(TmxObj* o)
  {
    if(--(o->refCount) == 0) {
      // Hooks and registrations get released from within callbacks they are calling,
      // so destructors may well add and remove references again. Parking the counter
      // far away from zero makes sure the object is deleted only ONCE.
      o->refCount = -4242;
      delete o;
    }
  }

}
