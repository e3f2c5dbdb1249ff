export module Graphics;

export import :BindingLayout;
export import :ShaderIR;
export import :CompileError;
export import :ShaderFrontend;
export import :ShaderCompiler;
export import :LayoutValidator;
export import :PipelineManager;
export import :Model;
export import :InstanceSync;
export import :LiveShader;
export import :ViewerContract;
