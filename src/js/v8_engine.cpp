/**
 * V8 JavaScript Engine Implementation
 *
 * Uses Google's V8 engine (as shipped by the Node.js development package)
 * for script execution and WebAssembly. One isolate and one context per
 * worker process.
 */

#include "scadhost/js/engine.h"
#include <iostream>
#include <unordered_map>
#include <unordered_set>
#include <cstring>

#if defined(SCADHOST_JS_V8)

#include "v8.h"
#include "libplatform/libplatform.h"

namespace scadhost {
namespace js {

// V8 platform (shared across all isolates)
static std::unique_ptr<v8::Platform> g_platform;
static bool g_initialized = false;

// Global set of protected handles that should not be deleted by nativeCallback cleanup
static std::unordered_set<void*> g_protectedHandles;

/**
 * Initialize V8 (call once per process)
 */
static bool initializeV8() {
    if (g_initialized) {
        return true;
    }

    v8::V8::InitializeICUDefaultLocation("");
    v8::V8::InitializeExternalStartupData("");

    g_platform = v8::platform::NewDefaultPlatform();
    v8::V8::InitializePlatform(g_platform.get());
    v8::V8::Initialize();

    g_initialized = true;
    std::cout << "[V8] Initialized, version " << v8::V8::GetVersion() << std::endl;

    return true;
}

class V8Engine : public Engine {
public:
    V8Engine() {
        if (!g_initialized) {
            initializeV8();
        }

        v8::Isolate::CreateParams create_params;
        create_params.array_buffer_allocator =
            v8::ArrayBuffer::Allocator::NewDefaultAllocator();
        isolate_ = v8::Isolate::New(create_params);
        allocator_ = create_params.array_buffer_allocator;
        isolate_->SetData(0, this);

        // Microtasks run only at runPendingJobs(), interleaved with libuv work
        isolate_->SetMicrotasksPolicy(v8::MicrotasksPolicy::kExplicit);

        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);

        v8::Local<v8::Context> context = v8::Context::New(isolate_);
        context_.Reset(isolate_, context);

        v8::Local<v8::Private> privateKey = v8::Private::ForApi(isolate_,
            v8::String::NewFromUtf8(isolate_, "__scadhost_private__").ToLocalChecked());
        privateKey_.Reset(isolate_, privateKey);

        consoleSink_ = [](const std::string& level, const std::string& message) {
            std::cout << "[" << level << "] " << message << std::endl;
        };

        {
            v8::Context::Scope context_scope(context);
            setupConsole();
        }
    }

    ~V8Engine() override {
        for (auto* fn : nativeFunctions_) {
            delete fn;
        }
        nativeFunctions_.clear();
        privateKey_.Reset();
        context_.Reset();
        isolate_->Dispose();
        delete allocator_;
    }

    const char* getName() const override { return "V8"; }

    // ========================================================================
    // Script Evaluation
    // ========================================================================

    bool evalScript(const std::string& code, const std::string& filename) override {
        JSValueHandle result = evalScriptWithResult(code, filename);
        if (!result.ptr) {
            return false;
        }
        release(result);
        return true;
    }

    JSValueHandle evalScriptWithResult(const std::string& code, const std::string& filename) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        v8::Local<v8::String> source;
        if (code.size() > static_cast<size_t>(v8::String::kMaxLength) ||
            !v8::String::NewFromUtf8(isolate_, code.data(), v8::NewStringType::kNormal,
                                     static_cast<int>(code.size())).ToLocal(&source)) {
            lastException_ = "Script source is too large";
            return {nullptr, isolate_};
        }

        v8::ScriptOrigin origin(isolate_,
            v8::String::NewFromUtf8(isolate_, filename.c_str()).ToLocalChecked());

        v8::TryCatch try_catch(isolate_);
        v8::Local<v8::Script> script;
        if (!v8::Script::Compile(context, source, &origin).ToLocal(&script)) {
            reportException(try_catch);
            return {nullptr, isolate_};
        }

        v8::Local<v8::Value> result;
        if (!script->Run(context).ToLocal(&result)) {
            reportException(try_catch);
            return {nullptr, isolate_};
        }

        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, result);
        return {persistent, isolate_};
    }

    bool runPendingJobs() override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        bool ranTask = false;
        while (v8::platform::PumpMessageLoop(g_platform.get(), isolate_)) {
            ranTask = true;
        }
        isolate_->PerformMicrotaskCheckpoint();
        return ranTask;
    }

    // ========================================================================
    // Value Creation
    // ========================================================================

    JSValueHandle newUndefined() override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, v8::Undefined(isolate_));
        return {persistent, isolate_};
    }

    JSValueHandle newBoolean(bool value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, v8::Boolean::New(isolate_, value));
        return {persistent, isolate_};
    }

    JSValueHandle newNumber(double value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, v8::Number::New(isolate_, value));
        return {persistent, isolate_};
    }

    JSValueHandle newString(const std::string& value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::String> str;
        if (!v8::String::NewFromUtf8(isolate_, value.data(), v8::NewStringType::kNormal,
                                     static_cast<int>(value.size())).ToLocal(&str)) {
            str = v8::String::Empty(isolate_);
        }
        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, str);
        return {persistent, isolate_};
    }

    JSValueHandle newObject() override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);
        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, v8::Object::New(isolate_));
        return {persistent, isolate_};
    }

    JSValueHandle newArrayBuffer(const uint8_t* data, size_t length) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        std::unique_ptr<v8::BackingStore> backingStore = v8::ArrayBuffer::NewBackingStore(
            isolate_, length);
        if (data && length > 0) {
            memcpy(backingStore->Data(), data, length);
        }

        v8::Local<v8::ArrayBuffer> arrayBuffer = v8::ArrayBuffer::New(
            isolate_, std::move(backingStore));

        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, arrayBuffer);
        return {persistent, isolate_};
    }

    void* getArrayBufferData(JSValueHandle value, size_t* size) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);

        v8::Persistent<v8::Value>* persistent = (v8::Persistent<v8::Value>*)value.ptr;
        if (!persistent) {
            if (size) *size = 0;
            return nullptr;
        }

        v8::Local<v8::Value> val = persistent->Get(isolate_);

        if (val->IsArrayBuffer()) {
            v8::Local<v8::ArrayBuffer> arrayBuffer = val.As<v8::ArrayBuffer>();
            std::shared_ptr<v8::BackingStore> backingStore = arrayBuffer->GetBackingStore();
            if (size) *size = backingStore->ByteLength();
            return backingStore->Data();
        }

        if (val->IsArrayBufferView()) {
            v8::Local<v8::ArrayBufferView> view = val.As<v8::ArrayBufferView>();
            v8::Local<v8::ArrayBuffer> arrayBuffer = view->Buffer();
            std::shared_ptr<v8::BackingStore> backingStore = arrayBuffer->GetBackingStore();
            if (size) *size = view->ByteLength();
            return static_cast<uint8_t*>(backingStore->Data()) + view->ByteOffset();
        }

        if (size) *size = 0;
        return nullptr;
    }

    JSValueHandle createUint8Array(const uint8_t* data, size_t count) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);

        std::unique_ptr<v8::BackingStore> backingStore = v8::ArrayBuffer::NewBackingStore(isolate_, count);
        if (data && count > 0) {
            memcpy(backingStore->Data(), data, count);
        }
        v8::Local<v8::ArrayBuffer> arrayBuffer = v8::ArrayBuffer::New(isolate_, std::move(backingStore));
        v8::Local<v8::Uint8Array> typedArray = v8::Uint8Array::New(arrayBuffer, 0, count);

        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, typedArray);
        return {persistent, isolate_};
    }

    JSValueHandle newFunction(const char* name, NativeFunction fn) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        // Owned by the engine; freed with the isolate
        auto* fnPtr = new NativeFunction(std::move(fn));
        nativeFunctions_.push_back(fnPtr);
        v8::Local<v8::External> external = v8::External::New(isolate_, fnPtr);

        v8::Local<v8::FunctionTemplate> templ = v8::FunctionTemplate::New(isolate_, nativeCallback, external);
        v8::Local<v8::Function> func = templ->GetFunction(context).ToLocalChecked();
        func->SetName(v8::String::NewFromUtf8(isolate_, name).ToLocalChecked());

        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, func);
        return {persistent, isolate_};
    }

    // ========================================================================
    // Value Conversion
    // ========================================================================

    bool toBoolean(JSValueHandle value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        return local(value)->BooleanValue(isolate_);
    }

    double toNumber(JSValueHandle value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        return local(value)->NumberValue(context).FromMaybe(0);
    }

    std::string toString(JSValueHandle value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Local<v8::String> str;
        if (!local(value)->ToString(context).ToLocal(&str)) {
            return "";
        }
        v8::String::Utf8Value utf8(isolate_, str);
        return *utf8 ? std::string(*utf8, utf8.length()) : std::string();
    }

    bool isFunction(JSValueHandle value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        return local(value)->IsFunction();
    }

    // ========================================================================
    // Object Operations
    // ========================================================================

    bool setProperty(JSValueHandle obj, const char* name, JSValueHandle value) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        v8::Local<v8::Value> target = local(obj);
        if (!target->IsObject()) {
            return false;
        }
        return target.As<v8::Object>()->Set(context,
            v8::String::NewFromUtf8(isolate_, name).ToLocalChecked(),
            local(value)).FromMaybe(false);
    }

    JSValueHandle getProperty(JSValueHandle obj, const char* name) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        v8::Local<v8::Value> target = local(obj);
        v8::Local<v8::Value> result = v8::Undefined(isolate_);
        if (target->IsObject()) {
            v8::TryCatch try_catch(isolate_);
            if (!target.As<v8::Object>()->Get(context,
                    v8::String::NewFromUtf8(isolate_, name).ToLocalChecked()).ToLocal(&result)) {
                reportException(try_catch);
                result = v8::Undefined(isolate_);
            }
        }

        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, result);
        return {persistent, isolate_};
    }

    JSValueHandle call(JSValueHandle func, JSValueHandle thisArg, const std::vector<JSValueHandle>& args) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        v8::Local<v8::Value> callee = local(func);
        if (!callee->IsFunction()) {
            lastException_ = "TypeError: value is not a function";
            return {nullptr, isolate_};
        }
        v8::Local<v8::Function> funcLocal = callee.As<v8::Function>();

        v8::Local<v8::Value> thisLocal = thisArg.ptr ? local(thisArg) : v8::Undefined(isolate_).As<v8::Value>();

        std::vector<v8::Local<v8::Value>> v8Args;
        v8Args.reserve(args.size());
        for (const auto& arg : args) {
            v8Args.push_back(local(arg));
        }

        v8::TryCatch try_catch(isolate_);
        v8::Local<v8::Value> result;
        if (!funcLocal->Call(context, thisLocal, (int)v8Args.size(), v8Args.data()).ToLocal(&result)) {
            reportException(try_catch);
            return {nullptr, isolate_};
        }

        v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate_, result);
        return {persistent, isolate_};
    }

    // ========================================================================
    // Memory Management
    // ========================================================================

    void protect(JSValueHandle value) override {
        // nativeCallback skips deletion for protected handles
        g_protectedHandles.insert(value.ptr);
    }

    void unprotect(JSValueHandle value) override {
        g_protectedHandles.erase(value.ptr);
        release(value);
    }

    // ========================================================================
    // Error Handling
    // ========================================================================

    std::string getException() override {
        std::string result = lastException_;
        lastException_.clear();
        return result;
    }

    void throwException(const char* message) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        isolate_->ThrowException(v8::Exception::Error(
            v8::String::NewFromUtf8(isolate_, message).ToLocalChecked()));
        lastException_ = message;
    }

    // ========================================================================
    // Private Data
    // ========================================================================

    void setPrivateData(JSValueHandle obj, void* data) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        v8::Local<v8::Value> target = local(obj);
        if (!target->IsObject()) {
            return;
        }
        v8::Local<v8::Private> key = privateKey_.Get(isolate_);
        target.As<v8::Object>()->SetPrivate(context, key, v8::External::New(isolate_, data)).Check();
    }

    void* getPrivateData(JSValueHandle obj) override {
        v8::Isolate::Scope isolate_scope(isolate_);
        v8::HandleScope handle_scope(isolate_);
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Context::Scope context_scope(context);

        v8::Local<v8::Value> target = local(obj);
        if (!target->IsObject()) {
            return nullptr;
        }
        v8::Local<v8::Private> key = privateKey_.Get(isolate_);

        v8::Local<v8::Value> result;
        if (!target.As<v8::Object>()->GetPrivate(context, key).ToLocal(&result) || !result->IsExternal()) {
            return nullptr;
        }
        return result.As<v8::External>()->Value();
    }

    void setConsoleSink(ConsoleSink sink) override {
        if (sink) {
            consoleSink_ = std::move(sink);
        }
    }

private:
    v8::Local<v8::Value> local(JSValueHandle handle) {
        auto* persistent = static_cast<v8::Persistent<v8::Value>*>(handle.ptr);
        if (!persistent) {
            return v8::Undefined(isolate_);
        }
        return persistent->Get(isolate_);
    }

    void release(JSValueHandle handle) {
        auto* persistent = static_cast<v8::Persistent<v8::Value>*>(handle.ptr);
        if (persistent) {
            persistent->Reset();
            delete persistent;
        }
    }

    void setupConsole() {
        v8::Local<v8::Context> context = context_.Get(isolate_);
        v8::Local<v8::Object> console = v8::Object::New(isolate_);
        v8::Local<v8::External> engineData = v8::External::New(isolate_, this);

        auto makeLogFn = [this, context, engineData](const char* level) {
            v8::Local<v8::Array> data = v8::Array::New(isolate_, 2);
            data->Set(context, 0, engineData).Check();
            data->Set(context, 1, v8::String::NewFromUtf8(isolate_, level).ToLocalChecked()).Check();
            return v8::FunctionTemplate::New(isolate_, [](const v8::FunctionCallbackInfo<v8::Value>& info) {
                v8::Isolate* isolate = info.GetIsolate();
                v8::HandleScope handle_scope(isolate);
                v8::Local<v8::Context> ctx = isolate->GetCurrentContext();

                v8::Local<v8::Array> data = info.Data().As<v8::Array>();
                auto* engine = static_cast<V8Engine*>(
                    data->Get(ctx, 0).ToLocalChecked().As<v8::External>()->Value());
                v8::String::Utf8Value levelUtf8(isolate, data->Get(ctx, 1).ToLocalChecked());

                std::string message;
                for (int i = 0; i < info.Length(); i++) {
                    v8::String::Utf8Value str(isolate, info[i]);
                    if (i > 0) message += " ";
                    message += (*str ? *str : "");
                }
                engine->consoleSink_(*levelUtf8 ? *levelUtf8 : "log", message);
            }, data)->GetFunction(context).ToLocalChecked();
        };

        const char* levels[] = {"log", "info", "warn", "error", "debug"};
        for (const char* level : levels) {
            console->Set(context, v8::String::NewFromUtf8(isolate_, level).ToLocalChecked(), makeLogFn(level)).Check();
        }

        context->Global()->Set(context, v8::String::NewFromUtf8(isolate_, "console").ToLocalChecked(), console).Check();
    }

    void reportException(v8::TryCatch& try_catch) {
        v8::HandleScope handle_scope(isolate_);
        v8::String::Utf8Value exception(isolate_, try_catch.Exception());
        const char* exception_string = *exception ? *exception : "<string conversion failed>";

        v8::Local<v8::Message> message = try_catch.Message();
        if (message.IsEmpty()) {
            std::cerr << "[V8] Error: " << exception_string << std::endl;
        } else {
            v8::String::Utf8Value filename(isolate_, message->GetScriptOrigin().ResourceName());
            int linenum = message->GetLineNumber(isolate_->GetCurrentContext()).FromMaybe(-1);
            std::cerr << "[V8] " << (*filename ? *filename : "<unknown>")
                      << ":" << linenum << ": " << exception_string << std::endl;
        }
        lastException_ = exception_string;
    }

    static void nativeCallback(const v8::FunctionCallbackInfo<v8::Value>& info) {
        v8::Isolate* isolate = info.GetIsolate();
        v8::HandleScope handle_scope(isolate);
        v8::Local<v8::Context> context = isolate->GetCurrentContext();
        v8::Context::Scope context_scope(context);

        v8::Local<v8::External> external = info.Data().As<v8::External>();
        NativeFunction* fn = static_cast<NativeFunction*>(external->Value());

        std::vector<JSValueHandle> args;
        args.reserve(info.Length());
        for (int i = 0; i < info.Length(); i++) {
            v8::Persistent<v8::Value>* persistent = new v8::Persistent<v8::Value>(isolate, info[i]);
            args.push_back({persistent, isolate});
        }

        JSValueHandle result = (*fn)(isolate, args);

        // Set return value BEFORE cleaning up args (in case result is one of the args)
        if (result.ptr) {
            v8::Persistent<v8::Value>* resPersistent = (v8::Persistent<v8::Value>*)result.ptr;
            info.GetReturnValue().Set(resPersistent->Get(isolate));
        }

        bool resultWasArg = false;
        for (auto& arg : args) {
            if (arg.ptr == result.ptr) {
                resultWasArg = true;
            }
            if (g_protectedHandles.find(arg.ptr) != g_protectedHandles.end()) {
                continue;
            }
            v8::Persistent<v8::Value>* persistent = (v8::Persistent<v8::Value>*)arg.ptr;
            persistent->Reset();
            delete persistent;
        }

        if (result.ptr && !resultWasArg && g_protectedHandles.find(result.ptr) == g_protectedHandles.end()) {
            v8::Persistent<v8::Value>* resPersistent = (v8::Persistent<v8::Value>*)result.ptr;
            resPersistent->Reset();
            delete resPersistent;
        }
    }

    v8::Isolate* isolate_ = nullptr;
    v8::ArrayBuffer::Allocator* allocator_ = nullptr;
    v8::Global<v8::Context> context_;
    v8::Global<v8::Private> privateKey_;
    std::string lastException_;
    ConsoleSink consoleSink_;
    std::vector<NativeFunction*> nativeFunctions_;
};

std::unique_ptr<Engine> createV8Engine() {
    return std::make_unique<V8Engine>();
}

} // namespace js
} // namespace scadhost

#endif  // SCADHOST_JS_V8
