/*
 * Copyright (C) 2026 Solaris
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef SOLARIS_SINGLETON_H
#define SOLARIS_SINGLETON_H

#include <boost/noncopyable.hpp>
#include <mutex>

namespace solaris
{
/* Lazily created process-wide instance. Access is not serialized; the
 * instance itself must be safe for the way it's used (Config and the schema
 * registry are only written during start-up, before workers are spawned).
 */
template <class T>
class UnlockedSingleton : private boost::noncopyable
{
public:
    typedef T* instance;

    static instance Instance()
    {
        std::call_once(once_, &UnlockedSingleton::CreateInst);
        return inst_;
    }

private:
    static instance inst_;
    static std::once_flag once_;

    static void CreateInst() { inst_ = new T; }
};

template <class T>
T* UnlockedSingleton<T>::inst_ = nullptr;
template <class T>
std::once_flag UnlockedSingleton<T>::once_;
}

#endif
