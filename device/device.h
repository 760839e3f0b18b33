// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.


#pragma once

#include "config.h"

#include <memory>

#include "device/graphics.h"

namespace dev {
    // OpenGL graphics context. The context is the interface for the device
    // to resolve the (possibly context specific) OpenGL entry points.
    // This abstraction allows the device to remain agnostic as to
    // what kind of windowing system/graphics subsystem is creating the context
    // and what is the ultimate rendering target (pbuffer, pixmap or window)
    class Context
    {
    public:
        enum class Version {
            OpenGL_ES3,
            WebGL_2
        };

        virtual ~Context() = default;
        // Make this context as the current context for the calling thread.
        virtual void MakeCurrent() = 0;
        // Resolve an OpenGL API function to a function pointer.
        // Returns a valid pointer or nullptr if there's no such
        // function. (For example an extension function is not available).
        virtual void* Resolve(const char* name) = 0;
        // Get the context version.
        virtual Version GetVersion() const = 0;
        // Check whether the context is a debug context or not.
        // if the context is a debug context then additional debug
        // features are enabled when supported by the underlying platform.
        virtual bool IsDebug() const
        { return false; }
    private:
    };

    // Create a new graphics device for the context. The context must
    // be current for the calling thread.
    std::shared_ptr<GraphicsDevice> CreateDevice(std::shared_ptr<Context> context);

} // namespace
