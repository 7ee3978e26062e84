//
//  SceneViewAR_JNI.h
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

#ifndef SceneViewAR_JNI_h
#define SceneViewAR_JNI_h

#include <jni.h>
#include <memory>

#define SV_METHOD(return_type, method_name) \
  JNIEXPORT return_type JNICALL              \
      Java_io_github_sceneview_ar_ARSceneNative_##method_name

/*
 Native objects are handed to Java as a jlong that owns a heap allocated
 shared_ptr. SV_REF_DELETE must be called exactly once per SV_REF_NEW.
 */
#define SV_REF(type) jlong
#define SV_REF_NEW(type, ptr) reinterpret_cast<jlong>(new std::shared_ptr<type>(ptr))
#define SV_REF_GET(type, ref) (*reinterpret_cast<std::shared_ptr<type> *>(ref))
#define SV_REF_DELETE(type, ref) delete reinterpret_cast<std::shared_ptr<type> *>(ref)

#endif /* SceneViewAR_JNI_h */
