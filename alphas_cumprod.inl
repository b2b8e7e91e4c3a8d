#ifndef __ALPHAS_CUMPROD_INL__
#define __ALPHAS_CUMPROD_INL__

// Cumulative products of (1 - beta_t) for the 1000 training timesteps of the
// scaled_linear schedule (beta_start = 0.00085, beta_end = 0.012).

static const float DDIM_ALPHAS_CUMPROD[1000] = {
    0.99915f, 0.998296f, 0.9974381f, 0.9965762f, 0.99571025f, 0.9948404f,
    0.9939665f, 0.9930887f, 0.9922069f, 0.9913211f, 0.9904313f, 0.98953754f,
    0.9886398f, 0.9877381f, 0.9868324f, 0.98592263f, 0.98500896f, 0.9840913f,
    0.9831696f, 0.982244f, 0.98131436f, 0.9803808f, 0.97944313f, 0.97850156f,
    0.977556f, 0.9766064f, 0.97565293f, 0.9746954f, 0.9737339f, 0.9727684f,
    0.97179896f, 0.97082555f, 0.96984816f, 0.96886677f, 0.9678814f, 0.96689206f,
    0.96589875f, 0.9649015f, 0.96390027f, 0.9628951f, 0.9618859f, 0.96087277f,
    0.95985574f, 0.95883465f, 0.9578097f, 0.95678073f, 0.95574784f, 0.954711f,
    0.95367026f, 0.9526256f, 0.9515769f, 0.95052433f, 0.94946784f, 0.94840735f,
    0.947343f, 0.94627476f, 0.9452025f, 0.9441264f, 0.9430464f, 0.9419625f,
    0.9408747f, 0.939783f, 0.9386874f, 0.93758786f, 0.9364845f, 0.93537724f,
    0.9342661f, 0.9331511f, 0.9320323f, 0.9309096f, 0.929783f, 0.9286526f,
    0.9275183f, 0.9263802f, 0.92523825f, 0.92409253f, 0.92294294f, 0.9217895f,
    0.92063236f, 0.9194713f, 0.9183065f, 0.9171379f, 0.91596556f, 0.9147894f,
    0.9136095f, 0.91242576f, 0.9112383f, 0.9100471f, 0.9088522f, 0.9076535f,
    0.9064511f, 0.90524495f, 0.9040351f, 0.90282154f, 0.9016043f, 0.90038335f,
    0.8991587f, 0.8979304f, 0.8966984f, 0.89546275f, 0.89422345f, 0.8929805f,
    0.89173394f, 0.89048374f, 0.88922995f, 0.8879725f, 0.8867115f, 0.88544685f,
    0.88417864f, 0.88290685f, 0.8816315f, 0.88035256f, 0.8790701f, 0.87778413f,
    0.8764946f, 0.8752016f, 0.873905f, 0.87260497f, 0.8713014f, 0.8699944f,
    0.86868393f, 0.86737f, 0.8660526f, 0.8647318f, 0.86340755f, 0.8620799f,
    0.8607488f, 0.85941434f, 0.8580765f, 0.8567353f, 0.8553907f, 0.8540428f,
    0.85269153f, 0.85133696f, 0.84997904f, 0.84861785f, 0.8472533f, 0.8458856f,
    0.8445145f, 0.84314024f, 0.84176266f, 0.8403819f, 0.8389979f, 0.8376107f,
    0.8362203f, 0.83482677f, 0.83343f, 0.8320301f, 0.8306271f, 0.8292209f,
    0.82781166f, 0.82639927f, 0.8249838f, 0.82356524f, 0.8221436f, 0.82071894f,
    0.81929123f, 0.81786054f, 0.8164268f, 0.8149901f, 0.8135504f, 0.81210774f,
    0.81066215f, 0.8092136f, 0.8077621f, 0.80630773f, 0.80485046f, 0.8033903f,
    0.80192727f, 0.8004614f, 0.79899275f, 0.79752123f, 0.7960469f, 0.7945698f,
    0.7930899f, 0.79160726f, 0.7901219f, 0.7886338f, 0.787143f, 0.7856495f,
    0.7841533f, 0.78265446f, 0.78115296f, 0.7796488f, 0.77814204f, 0.7766327f,
    0.7751208f, 0.7736063f, 0.77208924f, 0.7705697f, 0.7690476f, 0.767523f,
    0.7659959f, 0.7644664f, 0.76293445f, 0.7614f, 0.7598632f, 0.75832397f,
    0.75678235f, 0.75523835f, 0.75369203f, 0.7521434f, 0.75059247f, 0.7490392f,
    0.7474837f, 0.7459259f, 0.7443659f, 0.74280363f, 0.7412392f, 0.7396726f,
    0.7381038f, 0.73653287f, 0.7349598f, 0.7333846f, 0.73180735f, 0.730228f,
    0.7286466f, 0.7270631f, 0.7254777f, 0.72389024f, 0.72230077f, 0.7207094f,
    0.71911603f, 0.7175208f, 0.7159236f, 0.71432453f, 0.7127236f, 0.71112084f,
    0.7095162f, 0.7079098f, 0.7063016f, 0.70469165f, 0.70307994f, 0.7014665f,
    0.69985133f, 0.6982345f, 0.696616f, 0.6949958f, 0.69337404f, 0.69175065f,
    0.69012564f, 0.6884991f, 0.68687093f, 0.6852413f, 0.68361014f, 0.6819775f,
    0.6803434f, 0.67870784f, 0.6770708f, 0.6754324f, 0.6737926f, 0.67215145f,
    0.670509f, 0.66886514f, 0.66722f, 0.6655736f, 0.66392595f, 0.662277f,
    0.6606269f, 0.65897554f, 0.657323f, 0.65566933f, 0.6540145f, 0.6523586f,
    0.6507016f, 0.6490435f, 0.64738435f, 0.6457241f, 0.64406294f, 0.6424008f,
    0.64073765f, 0.63907355f, 0.63740855f, 0.6357426f, 0.6340758f, 0.6324082f,
    0.6307397f, 0.6290704f, 0.6274003f, 0.6257294f, 0.62405777f, 0.6223854f,
    0.62071234f, 0.6190386f, 0.61736417f, 0.6156891f, 0.61401343f, 0.6123372f,
    0.6106603f, 0.6089829f, 0.607305f, 0.6056265f, 0.6039476f, 0.60226816f,
    0.6005883f, 0.598908f, 0.59722733f, 0.5955463f, 0.59386486f, 0.5921831f,
    0.59050107f, 0.5888187f, 0.5871361f, 0.5854532f, 0.5837701f, 0.5820868f,
    0.5804033f, 0.5787197f, 0.5770359f, 0.575352f, 0.57366806f, 0.571984f,
    0.5702999f, 0.5686158f, 0.56693166f, 0.56524754f, 0.5635635f, 0.5618795f,
    0.56019557f, 0.5585118f, 0.5568281f, 0.55514455f, 0.5534612f, 0.551778f,
    0.5500951f, 0.5484124f, 0.54673f, 0.5450478f, 0.54336596f, 0.54168445f,
    0.54000324f, 0.53832245f, 0.5366421f, 0.53496206f, 0.5332825f, 0.53160346f,
    0.5299248f, 0.52824676f, 0.5265692f, 0.52489215f, 0.5232157f, 0.5215398f,
    0.51986456f, 0.51818997f, 0.51651603f, 0.51484275f, 0.5131702f, 0.5114983f,
    0.5098272f, 0.50815684f, 0.5064873f, 0.50481856f, 0.50315064f, 0.50148356f,
    0.4998174f, 0.4981521f, 0.49648774f, 0.49482432f, 0.49316183f, 0.49150035f,
    0.48983985f, 0.4881804f, 0.486522f, 0.48486462f, 0.4832084f, 0.48155323f,
    0.4798992f, 0.47824633f, 0.47659463f, 0.4749441f, 0.47329482f, 0.4716468f,
    0.47f, 0.46835446f, 0.46671024f, 0.46506736f, 0.4634258f, 0.46178558f,
    0.46014675f, 0.45850933f, 0.45687333f, 0.45523876f, 0.45360568f, 0.45197406f,
    0.45034397f, 0.44871536f, 0.44708833f, 0.44546285f, 0.44383895f, 0.44221666f,
    0.440596f, 0.43897697f, 0.43735963f, 0.43574396f, 0.43412998f, 0.43251774f,
    0.43090722f, 0.4292985f, 0.42769152f, 0.42608637f, 0.42448303f, 0.4228815f,
    0.42128187f, 0.4196841f, 0.41808826f, 0.4164943f, 0.4149023f, 0.41331223f,
    0.41172415f, 0.41013804f, 0.40855396f, 0.4069719f, 0.4053919f, 0.40381396f,
    0.4022381f, 0.40066436f, 0.39909273f, 0.39752322f, 0.3959559f, 0.39439073f,
    0.39282778f, 0.39126703f, 0.3897085f, 0.3881522f, 0.3865982f, 0.38504648f,
    0.38349706f, 0.38194993f, 0.38040516f, 0.37886274f, 0.37732267f, 0.375785f,
    0.37424973f, 0.37271687f, 0.37118647f, 0.36965853f, 0.36813304f, 0.36661002f,
    0.36508954f, 0.36357155f, 0.3620561f, 0.36054322f, 0.3590329f, 0.35752517f,
    0.35602003f, 0.35451752f, 0.35301763f, 0.3515204f, 0.3500258f, 0.3485339f,
    0.3470447f, 0.34555823f, 0.34407446f, 0.34259343f, 0.34111515f, 0.33963963f,
    0.33816692f, 0.336697f, 0.3352299f, 0.33376563f, 0.3323042f, 0.33084565f,
    0.32938993f, 0.32793713f, 0.3264872f, 0.32504022f, 0.32359615f, 0.32215503f,
    0.32071686f, 0.31928164f, 0.31784943f, 0.3164202f, 0.314994f, 0.3135708f,
    0.31215066f, 0.31073356f, 0.3093195f, 0.30790854f, 0.30650064f, 0.30509588f,
    0.30369422f, 0.30229566f, 0.30090025f, 0.299508f, 0.2981189f, 0.29673296f,
    0.29535022f, 0.2939707f, 0.29259437f, 0.29122123f, 0.28985137f, 0.28848472f,
    0.28712133f, 0.2857612f, 0.28440437f, 0.2830508f, 0.28170055f, 0.2803536f,
    0.27900997f, 0.27766964f, 0.27633268f, 0.27499905f, 0.2736688f, 0.27234194f,
    0.27101842f, 0.2696983f, 0.26838157f, 0.26706827f, 0.26575837f, 0.26445192f,
    0.26314887f, 0.2618493f, 0.26055318f, 0.2592605f, 0.25797132f, 0.2566856f,
    0.2554034f, 0.25412467f, 0.25284946f, 0.25157773f, 0.2503096f, 0.24904492f,
    0.24778382f, 0.24652626f, 0.24527225f, 0.2440218f, 0.24277493f, 0.24153163f,
    0.24029191f, 0.23905578f, 0.23782326f, 0.23659433f, 0.23536903f, 0.23414734f,
    0.23292927f, 0.23171483f, 0.23050404f, 0.22929688f, 0.22809339f, 0.22689353f,
    0.22569734f, 0.22450483f, 0.22331597f, 0.2221308f, 0.22094932f, 0.21977153f,
    0.21859743f, 0.21742703f, 0.21626033f, 0.21509734f, 0.21393807f, 0.21278252f,
    0.21163069f, 0.21048258f, 0.20933822f, 0.20819758f, 0.2070607f, 0.20592754f,
    0.20479813f, 0.20367248f, 0.20255059f, 0.20143245f, 0.20031808f, 0.19920748f,
    0.19810064f, 0.19699757f, 0.19589828f, 0.19480278f, 0.19371104f, 0.1926231f,
    0.19153893f, 0.19045855f, 0.18938197f, 0.18830918f, 0.18724018f, 0.18617497f,
    0.18511358f, 0.18405597f, 0.18300217f, 0.18195218f, 0.18090598f, 0.1798636f,
    0.17882504f, 0.17779027f, 0.1767593f, 0.17573217f, 0.17470883f, 0.1736893f,
    0.1726736f, 0.1716617f, 0.17065361f, 0.16964935f, 0.1686489f, 0.16765225f,
    0.16665943f, 0.16567042f, 0.16468522f, 0.16370384f, 0.16272627f, 0.16175252f,
    0.16078258f, 0.15981644f, 0.15885411f, 0.1578956f, 0.15694089f, 0.15599f,
    0.15504292f, 0.15409963f, 0.15316014f, 0.15222447f, 0.15129258f, 0.1503645f,
    0.14944021f, 0.14851972f, 0.14760303f, 0.14669013f, 0.14578101f, 0.14487568f,
    0.14397413f, 0.14307636f, 0.14218238f, 0.14129217f, 0.14040573f, 0.13952307f,
    0.13864417f, 0.13776903f, 0.13689767f, 0.13603005f, 0.13516618f, 0.13430607f,
    0.13344972f, 0.1325971f, 0.13174823f, 0.1309031f, 0.13006169f, 0.12922402f,
    0.12839006f, 0.12755983f, 0.12673332f, 0.12591052f, 0.12509143f, 0.12427604f,
    0.12346435f, 0.12265636f, 0.121852055f, 0.12105144f, 0.1202545f, 0.11946124f,
    0.11867165f, 0.11788572f, 0.11710346f, 0.11632485f, 0.115549885f, 0.11477857f,
    0.11401089f, 0.11324684f, 0.11248643f, 0.11172963f, 0.11097645f, 0.110226884f,
    0.10948092f, 0.10873855f, 0.10799977f, 0.107264586f, 0.106532976f, 0.105804935f,
    0.10508047f, 0.10435956f, 0.1036422f, 0.10292839f, 0.10221813f, 0.1015114f,
    0.10080819f, 0.100108504f, 0.09941233f, 0.098719664f, 0.0980305f, 0.09734483f,
    0.09666264f, 0.09598393f, 0.095308684f, 0.09463691f, 0.093968585f, 0.09330372f,
    0.092642285f, 0.09198428f, 0.09132971f, 0.09067855f, 0.090030804f, 0.089386456f,
    0.088745505f, 0.088107936f, 0.08747375f, 0.08684293f, 0.08621547f, 0.085591376f,
    0.084970616f, 0.08435319f, 0.0837391f, 0.08312833f, 0.08252087f, 0.08191671f,
    0.08131585f, 0.08071827f, 0.080123976f, 0.07953294f, 0.078945175f, 0.078360654f,
    0.077779375f, 0.07720133f, 0.07662651f, 0.07605491f, 0.07548651f, 0.07492131f,
    0.0743593f, 0.07380046f, 0.073244795f, 0.07269229f, 0.07214294f, 0.07159673f,
    0.07105365f, 0.070513695f, 0.06997685f, 0.069443114f, 0.06891247f, 0.06838491f,
    0.067860425f, 0.06733901f, 0.066820644f, 0.06630533f, 0.06579305f, 0.0652838f,
    0.06477757f, 0.06427433f, 0.0637741f, 0.063276865f, 0.06278259f, 0.062291294f,
    0.061802953f, 0.06131756f, 0.0608351f, 0.060355574f, 0.05987896f, 0.059405252f,
    0.058934443f, 0.05846652f, 0.058001474f, 0.057539295f, 0.05707997f, 0.056623492f,
    0.05616985f, 0.05571903f, 0.055271026f, 0.054825824f, 0.05438342f, 0.053943794f,
    0.053506944f, 0.05307286f, 0.052641522f, 0.052212927f, 0.051787063f, 0.051363923f,
    0.05094349f, 0.050525755f, 0.05011071f, 0.04969834f, 0.049288645f, 0.0488816f,
    0.048477206f, 0.048075445f, 0.04767631f, 0.047279786f, 0.04688587f, 0.046494544f,
    0.046105802f, 0.04571963f, 0.04533602f, 0.04495496f, 0.04457644f, 0.044200446f,
    0.04382697f, 0.043456003f, 0.043087535f, 0.042721547f, 0.042358037f, 0.04199699f,
    0.041638397f, 0.041282244f, 0.040928524f, 0.040577225f, 0.040228333f, 0.039881844f,
    0.039537743f, 0.039196018f, 0.038856663f, 0.038519662f, 0.038185004f, 0.037852682f,
    0.037522685f, 0.037195f, 0.036869615f, 0.036546525f, 0.036225714f, 0.03590717f,
    0.035590887f, 0.035276853f, 0.034965057f, 0.034655485f, 0.03434813f, 0.03404298f,
    0.033740025f, 0.033439253f, 0.033140652f, 0.032844216f, 0.03254993f, 0.032257784f,
    0.03196777f, 0.031679876f, 0.031394087f, 0.031110398f, 0.030828796f, 0.030549273f,
    0.030271813f, 0.02999641f, 0.029723052f, 0.029451728f, 0.029182427f, 0.02891514f,
    0.028649855f, 0.028386563f, 0.028125253f, 0.02786591f, 0.027608532f, 0.027353102f,
    0.027099613f, 0.026848052f, 0.026598409f, 0.026350675f, 0.02610484f, 0.02586089f,
    0.02561882f, 0.025378617f, 0.025140269f, 0.024903767f, 0.0246691f, 0.02443626f,
    0.024205236f, 0.023976017f, 0.023748592f, 0.023522953f, 0.023299087f, 0.023076987f,
    0.022856642f, 0.02263804f, 0.022421172f, 0.022206029f, 0.0219926f, 0.021780876f,
    0.021570845f, 0.021362498f, 0.021155827f, 0.020950818f, 0.020747466f, 0.020545758f,
    0.020345684f, 0.020147236f, 0.019950403f, 0.019755175f, 0.019561544f, 0.019369498f,
    0.019179028f, 0.018990126f, 0.01880278f, 0.018616982f, 0.018432721f, 0.01824999f,
    0.018068777f, 0.017889075f, 0.017710872f, 0.01753416f, 0.017358929f, 0.017185168f,
    0.017012872f, 0.016842028f, 0.016672628f, 0.016504662f, 0.016338123f, 0.016173f,
    0.016009282f, 0.015846964f, 0.015686033f, 0.015526483f, 0.015368304f, 0.015211486f,
    0.0150560215f, 0.014901901f, 0.014749114f, 0.014597654f, 0.014447511f, 0.0142986765f,
    0.014151142f, 0.014004898f, 0.013859936f, 0.013716248f, 0.0135738235f, 0.013432656f,
    0.013292736f, 0.013154055f, 0.013016605f, 0.012880377f, 0.012745362f, 0.012611552f,
    0.012478939f, 0.012347515f, 0.01221727f, 0.012088198f, 0.0119602885f, 0.0118335355f,
    0.011707929f, 0.011583461f, 0.011460125f, 0.011337912f, 0.011216813f, 0.011096821f,
    0.010977928f, 0.0108601255f, 0.010743406f, 0.010627762f, 0.0105131855f, 0.010399668f,
    0.010287202f, 0.01017578f, 0.010065395f, 0.009956039f, 0.009847702f, 0.009740381f,
    0.0096340645f, 0.009528747f, 0.009424419f, 0.009321076f, 0.009218709f, 0.00911731f,
    0.009016872f, 0.008917389f, 0.008818853f, 0.008721256f, 0.008624591f, 0.008528852f,
    0.00843403f, 0.00834012f, 0.008247114f, 0.008155004f, 0.008063785f, 0.007973449f,
    0.007883989f, 0.007795398f, 0.0077076694f, 0.0076207966f, 0.0075347726f, 0.007449591f,
    0.0073652444f, 0.007281727f, 0.0071990318f, 0.007117152f, 0.0070360815f, 0.0069558136f,
    0.0068763415f, 0.006797659f, 0.00671976f, 0.0066426382f, 0.0065662866f, 0.006490699f,
    0.0064158696f, 0.006341792f, 0.00626846f, 0.0061958674f, 0.0061240084f, 0.0060528764f,
    0.0059824656f, 0.0059127696f, 0.0058437833f, 0.0057755f, 0.0057079145f, 0.00564102f,
    0.0055748112f, 0.0055092825f, 0.005444428f, 0.005380241f, 0.0053167176f, 0.005253851f,
    0.005191636f, 0.005130066f, 0.0050691366f, 0.0050088423f, 0.0049491767f, 0.004890135f,
    0.0048317118f, 0.004773902f, 0.004716699f, 0.0046600983f
};

#endif  // __ALPHAS_CUMPROD_INL__
