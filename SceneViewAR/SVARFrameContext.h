//
//  SVARFrameContext.h
//  SceneViewAR
//
//  Copyright © 2025 Viro Media. All rights reserved.
//
//  Permission is hereby granted, free of charge, to any person obtaining
//  a copy of this software and associated documentation files (the
//  "Software"), to deal in the Software without restriction, including
//  without limitation the rights to use, copy, modify, merge, publish,
//  distribute, sublicense, and/or sell copies of the Software, and to
//  permit persons to whom the Software is furnished to do so, subject to
//  the following conditions:
//
//  The above copyright notice and this permission notice shall be included
//  in all copies or substantial portions of the Software.
//
//  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
//  EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
//  MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
//  IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
//  CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
//  TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
//  SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#ifndef SVARFrameContext_h
#define SVARFrameContext_h

#include <memory>
#include "SVARFrame.h"
#include "SVARSession.h"

/*
 Everything a tracking behavior may use during one frame update. Passed
 down the node hierarchy by SVARScene; behaviors never look the session up
 on their own.
 */
struct SVARFrameContext {
    std::shared_ptr<SVARSession> session;
    std::shared_ptr<SVARFrame> frame;
    std::shared_ptr<SVARFrame> previousFrame;

    /*
     Seconds since the previous frame, or zero on the first frame.
     */
    double getDeltaSeconds() const {
        if (!frame || !previousFrame) {
            return 0;
        }
        return frame->intervalSeconds(previousFrame.get());
    }
};

#endif /* SVARFrameContext_h */
